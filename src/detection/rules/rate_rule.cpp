#include "rate_rule.hpp"
#include "core/logger.hpp"
#include "scoring.hpp"

#include <string>

std::optional<RuleSignal> RateRule::evaluate(const RuleContext &context) {
  const auto &profile = context.settings.profile;
  const uint64_t subject_ts = context.window.subject->received_at_ms;
  const uint64_t window_ms = profile.rate_window_seconds * 1000;
  const uint64_t since_ts = subject_ts >= window_ms ? subject_ts - window_ms : 0;

  std::vector<uint64_t> message_ids;
  for (const auto &entry : *context.window.entries)
    if (entry.timestamp_ms >= since_ts && entry.timestamp_ms <= subject_ts)
      message_ids.push_back(entry.message_id);

  // A late arrival pushed out by the count bound still counts itself
  if (!context.window.subject_in_window())
    message_ids.push_back(context.window.subject->message_id);

  const size_t count = message_ids.size();
  if (count < profile.rate_threshold)
    return std::nullopt;

  RuleSignal signal;
  signal.rule = RuleId::RATE;
  signal.confidence = Scoring::from_rate(count, profile.rate_threshold);
  signal.evidence = std::to_string(count) + " messages in " +
                    std::to_string(profile.rate_window_seconds) +
                    "s (threshold " + std::to_string(profile.rate_threshold) +
                    ")";
  signal.evidence_message_ids = std::move(message_ids);

  LOG(LogLevel::DEBUG, LogComponent::RULES_RATE,
      "Rate rule fired for " << context.window.key.to_string() << ": "
                             << signal.evidence << ", confidence "
                             << signal.confidence);
  return signal;
}
