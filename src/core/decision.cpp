#include "decision.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

const char *rule_id_to_string(RuleId rule) {
  switch (rule) {
  case RuleId::RATE:
    return "rate";
  case RuleId::DUPLICATE:
    return "duplicate_content";
  case RuleId::SUSPICIOUS_LINK:
    return "suspicious_link";
  case RuleId::NEW_ACCOUNT_RISK:
    return "new_account_risk";
  case RuleId::CONTENT_SPAM:
    return "content_spam";
  }
  return "unknown";
}

std::optional<RuleId> parse_rule_id(const std::string &text) {
  for (auto rule : {RuleId::RATE, RuleId::DUPLICATE, RuleId::SUSPICIOUS_LINK,
                    RuleId::NEW_ACCOUNT_RISK, RuleId::CONTENT_SPAM})
    if (text == rule_id_to_string(rule))
      return rule;
  return std::nullopt;
}

const char *action_type_to_string(ActionType action) {
  switch (action) {
  case ActionType::NONE:
    return "none";
  case ActionType::WARN:
    return "warn";
  case ActionType::MUTE:
    return "mute";
  }
  return "none";
}

std::optional<ActionType> parse_action_type(const std::string &text) {
  for (auto action : {ActionType::NONE, ActionType::WARN, ActionType::MUTE})
    if (text == action_type_to_string(action))
      return action;
  return std::nullopt;
}

const char *decision_stage_to_string(DecisionStage stage) {
  switch (stage) {
  case DecisionStage::INTAKE:
    return "intake";
  case DecisionStage::EVALUATED:
    return "evaluated";
  case DecisionStage::DECIDED:
    return "decided";
  case DecisionStage::ESCALATED:
    return "escalated";
  case DecisionStage::TERMINAL:
    return "terminal";
  }
  return "intake";
}

const char *api_call_kind_to_string(ApiCallKind kind) {
  switch (kind) {
  case ApiCallKind::MUTE:
    return "mute";
  case ApiCallKind::DELETE_MESSAGE:
    return "delete_message";
  case ApiCallKind::WARN:
    return "warn";
  }
  return "unknown";
}

std::optional<ApiCallKind> parse_api_call_kind(const std::string &text) {
  for (auto kind :
       {ApiCallKind::MUTE, ApiCallKind::DELETE_MESSAGE, ApiCallKind::WARN})
    if (text == api_call_kind_to_string(kind))
      return kind;
  return std::nullopt;
}

bool Decision::has_rule(RuleId rule) const {
  return std::find(triggering_rules.begin(), triggering_rules.end(), rule) !=
         triggering_rules.end();
}

std::string Decision::reason() const {
  std::ostringstream oss;
  oss << "Automated " << action_type_to_string(action) << ": ";
  for (size_t i = 0; i < triggering_rules.size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << rule_id_to_string(triggering_rules[i]);
  }
  oss << " (confidence " << std::fixed;
  oss.precision(2);
  oss << combined_confidence << ")";
  return oss.str();
}

bool Decision::equivalent_to(const Decision &other) const {
  constexpr double epsilon = 1e-9;
  if (guild_id != other.guild_id || channel_id != other.channel_id ||
      user_id != other.user_id || message_id != other.message_id ||
      sensitivity != other.sensitivity || action != other.action ||
      duration_seconds != other.duration_seconds ||
      offense_count != other.offense_count ||
      triggering_rules != other.triggering_rules ||
      signals.size() != other.signals.size())
    return false;

  if (std::fabs(combined_confidence - other.combined_confidence) > epsilon ||
      std::fabs(risk_multiplier - other.risk_multiplier) > epsilon)
    return false;

  for (size_t i = 0; i < signals.size(); ++i) {
    const auto &a = signals[i];
    const auto &b = other.signals[i];
    if (a.rule != b.rule || std::fabs(a.confidence - b.confidence) > epsilon ||
        a.evidence_message_ids != b.evidence_message_ids)
      return false;
  }
  return true;
}
