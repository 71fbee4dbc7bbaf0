#ifndef AUDIT_ENTRY_HPP
#define AUDIT_ENTRY_HPP

#include "decision.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Append-only record of one terminal decision or one moderator action
struct AuditLogEntry {
  uint64_t id = 0;
  uint64_t guild_id = 0;
  uint64_t user_id = 0;
  uint64_t channel_id = 0;
  uint64_t message_id = 0;

  ActionType action = ActionType::NONE;
  std::vector<RuleId> triggering_rules;
  double confidence = 0.0;
  uint64_t duration_seconds = 0;
  std::optional<uint64_t> moderator_id; // unset for automated actions
  std::string reason;

  uint64_t decided_at_ms = 0;
  uint64_t timestamp_ms = 0; // when the final outcome was known

  bool success = false;
  size_t total_attempts = 0;
  std::vector<CallOutcome> calls;
  std::string error;

  static AuditLogEntry from_decision(const Decision &decision);
};

struct AuditQueryFilter {
  std::optional<uint64_t> user_id;
  std::optional<ActionType> action;
  std::optional<uint64_t> since_ms;

  bool matches(const AuditLogEntry &entry) const;
};

#endif // AUDIT_ENTRY_HPP
