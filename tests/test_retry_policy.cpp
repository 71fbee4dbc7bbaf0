#include "enforcement/retry_policy.hpp"

#include <gtest/gtest.h>

using std::chrono::milliseconds;

namespace {

Config::ActionExecutorConfig make_config() {
  Config::ActionExecutorConfig config;
  config.max_attempts = 5;
  config.base_delay_ms = 1000;
  config.max_delay_ms = 32000;
  config.backoff_multiplier = 2.0;
  config.jitter_min = 1.0;
  config.jitter_max = 1.0;
  return config;
}

} // namespace

TEST(RetryPolicyTest, BackoffGrowsExponentiallyToCap) {
  RetryPolicy policy(make_config(), 42);
  EXPECT_EQ(policy.backoff_delay(1), milliseconds(1000));
  EXPECT_EQ(policy.backoff_delay(2), milliseconds(2000));
  EXPECT_EQ(policy.backoff_delay(3), milliseconds(4000));
  EXPECT_EQ(policy.backoff_delay(6), milliseconds(32000));
  EXPECT_EQ(policy.backoff_delay(20), milliseconds(32000));
}

TEST(RetryPolicyTest, JitterStaysInConfiguredBand) {
  auto config = make_config();
  config.jitter_min = 0.75;
  config.jitter_max = 1.0;
  RetryPolicy policy(config, 7);

  ApiResult failure = ApiResult::retryable("HTTP 503", 503);
  for (int i = 0; i < 100; ++i) {
    auto delay = policy.next_delay(2, failure);
    EXPECT_GE(delay, milliseconds(1500));
    EXPECT_LE(delay, milliseconds(2000));
  }
}

TEST(RetryPolicyTest, RetryAfterHintWinsWhenLonger) {
  RetryPolicy policy(make_config(), 1);
  ApiResult limited =
      ApiResult::retryable("rate limited", 429, milliseconds(5000));
  EXPECT_EQ(policy.next_delay(1, limited), milliseconds(5000));

  ApiResult short_hint =
      ApiResult::retryable("rate limited", 429, milliseconds(10));
  EXPECT_EQ(policy.next_delay(1, short_hint), milliseconds(1000));
}

TEST(RetryPolicyTest, MaxAttemptsIsAtLeastOne) {
  auto config = make_config();
  config.max_attempts = 0;
  RetryPolicy policy(config, 1);
  EXPECT_EQ(policy.max_attempts(), 1u);

  config.max_attempts = 4;
  policy.reconfigure(config);
  EXPECT_EQ(policy.max_attempts(), 4u);
}

TEST(RetryPolicyTest, OversizedHintIsCappedAndFlagged) {
  auto config = make_config();
  config.max_retry_after_ms = 60000;
  RetryPolicy policy(config, 1);

  ApiResult huge = ApiResult::retryable("rate limited", 429,
                                        parse_retry_after_seconds("1e20"));
  ASSERT_TRUE(huge.retry_after.has_value());
  EXPECT_TRUE(policy.hint_exceeds_limit(huge));
  EXPECT_EQ(policy.next_delay(1, huge), milliseconds(60000));

  ApiResult fair =
      ApiResult::retryable("rate limited", 429, milliseconds(60000));
  EXPECT_FALSE(policy.hint_exceeds_limit(fair));
  EXPECT_FALSE(policy.hint_exceeds_limit(ApiResult::retryable("HTTP 503", 503)));
}
