#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include "core/config.hpp"
#include "enforcement/api_result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

// Exponential backoff with jitter. Attempt numbers start at 1; the delay
// returned for attempt n is the wait before attempt n + 1.
class RetryPolicy {
public:
  explicit RetryPolicy(const Config::ActionExecutorConfig &config);
  RetryPolicy(const Config::ActionExecutorConfig &config, uint32_t seed);

  void reconfigure(const Config::ActionExecutorConfig &config);

  size_t max_attempts() const;

  // base * multiplier^(attempt - 1), capped at max_delay, without jitter
  std::chrono::milliseconds backoff_delay(size_t attempt) const;

  // Jittered backoff, superseded by the result's wait hint when that is
  // larger
  std::chrono::milliseconds next_delay(size_t attempt, const ApiResult &result);

  // True when the server asks for a longer wait than max_retry_after_ms
  bool hint_exceeds_limit(const ApiResult &result) const;

private:
  mutable std::mutex mutex_;
  Config::ActionExecutorConfig config_;
  std::mt19937 rng_;
};

#endif // RETRY_POLICY_HPP
