#ifndef DECISION_HPP
#define DECISION_HPP

#include "config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class RuleId {
  RATE,
  DUPLICATE,
  SUSPICIOUS_LINK,
  NEW_ACCOUNT_RISK,
  CONTENT_SPAM
};

enum class ActionType { NONE = 0, WARN = 1, MUTE = 2 };

// INTAKE -> EVALUATED -> DECIDED -> (ESCALATED) -> TERMINAL
enum class DecisionStage { INTAKE, EVALUATED, DECIDED, ESCALATED, TERMINAL };

enum class ApiCallKind { MUTE, DELETE_MESSAGE, WARN };

const char *rule_id_to_string(RuleId rule);
std::optional<RuleId> parse_rule_id(const std::string &text);
const char *action_type_to_string(ActionType action);
std::optional<ActionType> parse_action_type(const std::string &text);
const char *decision_stage_to_string(DecisionStage stage);
const char *api_call_kind_to_string(ApiCallKind kind);
std::optional<ApiCallKind> parse_api_call_kind(const std::string &text);

struct RuleSignal {
  RuleId rule = RuleId::RATE;
  double confidence = 0.0;
  std::string evidence;
  std::vector<uint64_t> evidence_message_ids;
};

// Final result of one external call after retries
struct CallOutcome {
  ApiCallKind kind = ApiCallKind::MUTE;
  bool success = false;
  size_t attempts = 0;
  int last_status = 0; // 0 when no HTTP response was received
  std::string error;
};

struct ActionOutcome {
  bool success = false;
  size_t total_attempts = 0;
  std::vector<CallOutcome> calls;
  uint64_t completed_at_ms = 0;
  std::string error;
};

struct Decision {
  uint64_t guild_id = 0;
  uint64_t channel_id = 0;
  uint64_t user_id = 0;
  uint64_t message_id = 0;

  Config::SensitivityLevel sensitivity = Config::SensitivityLevel::MEDIUM;
  DecisionStage stage = DecisionStage::INTAKE;
  ActionType action = ActionType::NONE;
  double combined_confidence = 0.0;
  double risk_multiplier = 1.0;
  uint64_t duration_seconds = 0;
  uint32_t offense_count = 0; // mutes in the escalation window, this one included

  std::vector<RuleId> triggering_rules;
  std::vector<RuleSignal> signals;

  // Wall clock at evaluation, for audit only. Two evaluations of the same
  // snapshot differ here and nowhere else.
  uint64_t decided_at_ms = 0;
  std::optional<ActionOutcome> outcome;

  bool is_actionable() const { return action != ActionType::NONE; }
  bool has_rule(RuleId rule) const;
  std::string reason() const;

  // Equality of everything the decision path computes; timestamps and the
  // execution outcome are excluded
  bool equivalent_to(const Decision &other) const;
};

#endif // DECISION_HPP
