#include "duplicate_rule.hpp"
#include "analysis/fingerprint.hpp"
#include "core/logger.hpp"
#include "scoring.hpp"

#include <iomanip>
#include <sstream>

std::optional<RuleSignal> DuplicateRule::evaluate(const RuleContext &context) {
  const auto &profile = context.settings.profile;
  const auto &entries = *context.window.entries;
  const Fingerprint &subject = *context.window.subject_fingerprint;
  const uint64_t subject_ts = context.window.subject->received_at_ms;

  // Entries strictly before the subject, newest first
  size_t end = context.window.subject_index();
  if (end == entries.size()) {
    end = 0;
    while (end < entries.size() && entries[end].timestamp_ms <= subject_ts)
      ++end;
  }

  const size_t lookback = context.config.rules.duplicate_lookback;
  size_t run_length = 1;
  double best_similarity = -1.0;
  uint64_t best_message_id = 0;
  std::vector<uint64_t> run_ids;

  for (size_t i = end, examined = 0; i > 0 && examined < lookback;
       --i, ++examined) {
    const WindowEntry &previous = entries[i - 1];
    if (!previous.fingerprint)
      break;

    double similarity = fingerprint_similarity(
        subject, *previous.fingerprint, profile.duplicate_similarity);
    if (similarity < profile.duplicate_similarity)
      break;

    ++run_length;
    run_ids.push_back(previous.message_id);
    // Walking newest first, so strict comparison keeps the most recent pair
    if (similarity > best_similarity) {
      best_similarity = similarity;
      best_message_id = previous.message_id;
    }
  }

  if (run_length < 2 || run_length < profile.duplicate_min_consecutive)
    return std::nullopt;

  RuleSignal signal;
  signal.rule = RuleId::DUPLICATE;
  signal.confidence = Scoring::from_duplicate_run(
      best_similarity, run_length, profile.duplicate_min_consecutive);

  std::ostringstream evidence;
  evidence << run_length << " consecutive similar messages, best match "
           << best_message_id << " at " << std::fixed << std::setprecision(2)
           << best_similarity;
  signal.evidence = evidence.str();
  signal.evidence_message_ids.push_back(context.window.subject->message_id);
  signal.evidence_message_ids.insert(signal.evidence_message_ids.end(),
                                     run_ids.begin(), run_ids.end());

  LOG(LogLevel::DEBUG, LogComponent::RULES_DUPLICATE,
      "Duplicate rule fired for " << context.window.key.to_string() << ": "
                                  << signal.evidence << ", confidence "
                                  << signal.confidence);
  return signal;
}
