#include "retry_policy.hpp"

#include <algorithm>

RetryPolicy::RetryPolicy(const Config::ActionExecutorConfig &config)
    : RetryPolicy(config, std::random_device{}()) {}

RetryPolicy::RetryPolicy(const Config::ActionExecutorConfig &config,
                         uint32_t seed)
    : config_(config), rng_(seed) {}

void RetryPolicy::reconfigure(const Config::ActionExecutorConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
}

size_t RetryPolicy::max_attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::max<size_t>(1, config_.max_attempts);
}

std::chrono::milliseconds RetryPolicy::backoff_delay(size_t attempt) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const double cap = static_cast<double>(config_.max_delay_ms);
  double delay = static_cast<double>(config_.base_delay_ms);
  for (size_t i = 1; i < attempt && delay < cap; ++i)
    delay *= config_.backoff_multiplier;
  return std::chrono::milliseconds(
      static_cast<long long>(std::min(delay, cap)));
}

std::chrono::milliseconds RetryPolicy::next_delay(size_t attempt,
                                                  const ApiResult &result) {
  const auto base = backoff_delay(attempt);

  std::lock_guard<std::mutex> lock(mutex_);
  double jitter = 1.0;
  double low = std::min(config_.jitter_min, config_.jitter_max);
  double high = std::max(config_.jitter_min, config_.jitter_max);
  if (high > low) {
    std::uniform_real_distribution<double> distribution(low, high);
    jitter = distribution(rng_);
  } else {
    jitter = low;
  }

  auto delay = std::chrono::milliseconds(
      static_cast<long long>(static_cast<double>(base.count()) * jitter));
  if (result.retry_after) {
    const std::chrono::milliseconds hint_cap(
        static_cast<long long>(config_.max_retry_after_ms));
    delay = std::max(delay, std::min(*result.retry_after, hint_cap));
  }
  return delay;
}

bool RetryPolicy::hint_exceeds_limit(const ApiResult &result) const {
  if (!result.retry_after)
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  return result.retry_after->count() >
         static_cast<long long>(config_.max_retry_after_ms);
}
