#include "audit_entry.hpp"
#include "utils/utils.hpp"

#include <algorithm>

AuditLogEntry AuditLogEntry::from_decision(const Decision &decision) {
  AuditLogEntry entry;
  entry.guild_id = decision.guild_id;
  entry.user_id = decision.user_id;
  entry.channel_id = decision.channel_id;
  entry.message_id = decision.message_id;
  entry.action = decision.action;
  entry.triggering_rules = decision.triggering_rules;
  entry.confidence = decision.combined_confidence;
  entry.duration_seconds = decision.duration_seconds;
  entry.reason = decision.reason();
  entry.decided_at_ms = decision.decided_at_ms;

  if (decision.outcome) {
    entry.success = decision.outcome->success;
    entry.total_attempts = decision.outcome->total_attempts;
    entry.calls = decision.outcome->calls;
    entry.error = decision.outcome->error;
    entry.timestamp_ms = decision.outcome->completed_at_ms;
  } else {
    // Nothing was executed for this decision
    entry.success = !decision.is_actionable();
    entry.timestamp_ms = Utils::get_current_time_ms();
  }
  entry.timestamp_ms = std::max(entry.timestamp_ms, entry.decided_at_ms);
  return entry;
}

bool AuditQueryFilter::matches(const AuditLogEntry &entry) const {
  if (user_id && entry.user_id != *user_id)
    return false;
  if (action && entry.action != *action)
    return false;
  if (since_ms && entry.timestamp_ms < *since_ms)
    return false;
  return true;
}
