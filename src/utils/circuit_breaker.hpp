#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace circuit_breaker {

enum class State {
  CLOSED,   // Normal operation
  OPEN,     // Circuit breaker open, rejecting calls
  HALF_OPEN // A single trial call is probing recovery
};

const char *state_to_string(State state);

// Guards one downstream endpoint. Callers ask allow_request() before each
// attempt and report the outcome of every permitted attempt with
// record_success() or record_failure().
class CircuitBreaker {
public:
  struct Config {
    size_t failure_threshold;
    std::chrono::milliseconds timeout;
    size_t success_threshold;

    Config()
        : failure_threshold(5), timeout(std::chrono::milliseconds(60000)),
          success_threshold(1) {}
  };

  explicit CircuitBreaker(const std::string &name,
                          const Config &config = Config{});
  ~CircuitBreaker() = default;

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  // False while OPEN and cooling down, and while HALF_OPEN has a trial call
  // in flight. The call that moves OPEN to HALF_OPEN is the trial.
  bool allow_request();

  void record_success();
  void record_failure();

  // State queries
  State get_state() const;
  std::string get_state_string() const { return state_to_string(get_state()); }
  size_t get_consecutive_failures() const;
  const std::string &get_name() const { return name_; }

  // Metrics for monitoring
  struct Metrics {
    size_t total_calls = 0;
    size_t successful_calls = 0;
    size_t failed_calls = 0;
    size_t rejected_calls = 0;
    std::chrono::steady_clock::time_point last_failure_time;
    std::chrono::steady_clock::time_point last_state_change;
  };

  Metrics get_metrics() const;
  void reset();

private:
  void transition_to_state(State new_state);
  bool cool_down_elapsed() const;

  const std::string name_;
  const Config config_;

  mutable std::mutex mutex_;
  State state_ = State::CLOSED;
  size_t consecutive_failures_ = 0;
  size_t consecutive_successes_ = 0;
  bool trial_in_flight_ = false;
  std::chrono::steady_clock::time_point state_change_time_;
  Metrics metrics_;
};

// Process-wide set of breakers, one per downstream endpoint name
class CircuitBreakerRegistry {
public:
  static CircuitBreakerRegistry &instance();

  CircuitBreakerRegistry() = default;
  CircuitBreakerRegistry(const CircuitBreakerRegistry &) = delete;
  CircuitBreakerRegistry &operator=(const CircuitBreakerRegistry &) = delete;

  // The config is only used when the breaker does not exist yet
  std::shared_ptr<CircuitBreaker>
  get_or_create(const std::string &endpoint,
                const CircuitBreaker::Config &config = CircuitBreaker::Config{});

  std::map<std::string, State> snapshot_states() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace circuit_breaker
