#include "circuit_breaker.hpp"
#include "core/logger.hpp"

namespace circuit_breaker {

const char *state_to_string(State state) {
  switch (state) {
  case State::CLOSED:
    return "CLOSED";
  case State::OPEN:
    return "OPEN";
  case State::HALF_OPEN:
    return "HALF_OPEN";
  }
  return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(const std::string &name, const Config &config)
    : name_(name), config_(config) {
  state_change_time_ = std::chrono::steady_clock::now();
  metrics_.last_state_change = state_change_time_;
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.total_calls++;

  if (state_ == State::OPEN && cool_down_elapsed()) {
    transition_to_state(State::HALF_OPEN);
    trial_in_flight_ = true;
    return true;
  }

  if (state_ == State::OPEN ||
      (state_ == State::HALF_OPEN && trial_in_flight_)) {
    metrics_.rejected_calls++;
    return false;
  }

  if (state_ == State::HALF_OPEN)
    trial_in_flight_ = true;
  return true;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.successful_calls++;
  consecutive_failures_ = 0;
  consecutive_successes_++;

  if (state_ == State::HALF_OPEN) {
    trial_in_flight_ = false;
    if (consecutive_successes_ >= config_.success_threshold)
      transition_to_state(State::CLOSED);
  }
}

void CircuitBreaker::record_failure() {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.failed_calls++;
  metrics_.last_failure_time = std::chrono::steady_clock::now();
  consecutive_successes_ = 0;
  consecutive_failures_++;

  if (state_ == State::HALF_OPEN) {
    trial_in_flight_ = false;
    transition_to_state(State::OPEN);
  } else if (state_ == State::CLOSED &&
             consecutive_failures_ >= config_.failure_threshold) {
    transition_to_state(State::OPEN);
  }
}

State CircuitBreaker::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

size_t CircuitBreaker::get_consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

CircuitBreaker::Metrics CircuitBreaker::get_metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);

  state_ = State::CLOSED;
  consecutive_failures_ = 0;
  consecutive_successes_ = 0;
  trial_in_flight_ = false;

  metrics_ = Metrics{};
  state_change_time_ = std::chrono::steady_clock::now();
  metrics_.last_state_change = state_change_time_;
}

// Caller holds mutex_
void CircuitBreaker::transition_to_state(State new_state) {
  if (state_ == new_state)
    return;

  LOG(LogLevel::WARN, LogComponent::CIRCUIT,
      "Circuit '" << name_ << "' " << state_to_string(state_) << " -> "
                  << state_to_string(new_state) << " after "
                  << consecutive_failures_ << " consecutive failures");

  state_ = new_state;
  consecutive_successes_ = 0;
  state_change_time_ = std::chrono::steady_clock::now();
  metrics_.last_state_change = state_change_time_;
}

bool CircuitBreaker::cool_down_elapsed() const {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - state_change_time_);
  return elapsed >= config_.timeout;
}

CircuitBreakerRegistry &CircuitBreakerRegistry::instance() {
  static CircuitBreakerRegistry instance;
  return instance;
}

std::shared_ptr<CircuitBreaker>
CircuitBreakerRegistry::get_or_create(const std::string &endpoint,
                                      const CircuitBreaker::Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = breakers_.find(endpoint);
  if (it != breakers_.end())
    return it->second;

  auto breaker = std::make_shared<CircuitBreaker>(endpoint, config);
  breakers_.emplace(endpoint, breaker);
  return breaker;
}

std::map<std::string, State> CircuitBreakerRegistry::snapshot_states() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, State> states;
  for (const auto &[endpoint, breaker] : breakers_)
    states[endpoint] = breaker->get_state();
  return states;
}

} // namespace circuit_breaker
