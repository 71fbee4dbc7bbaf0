#include "json_formatter.hpp"
#include "utils/utils.hpp"

namespace {

std::optional<uint64_t> read_u64(const nlohmann::json &j, const char *field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (it->is_number_unsigned())
    return it->get<uint64_t>();
  if (it->is_number_integer()) {
    auto value = it->get<int64_t>();
    if (value < 0)
      return std::nullopt;
    return static_cast<uint64_t>(value);
  }
  if (it->is_string())
    return Utils::string_to_number<uint64_t>(it->get<std::string>());
  return std::nullopt;
}

template <typename T>
T read_or(const nlohmann::json &j, const char *field, T default_value) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null())
    return default_value;
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception &) {
    return default_value;
  }
}

} // namespace

nlohmann::json
JsonFormatter::call_outcome_to_json_object(const CallOutcome &call) {
  nlohmann::json j;
  j["kind"] = api_call_kind_to_string(call.kind);
  j["success"] = call.success;
  j["attempts"] = call.attempts;
  j["last_status"] = call.last_status;
  if (!call.error.empty())
    j["error"] = call.error;
  return j;
}

nlohmann::json
JsonFormatter::audit_entry_to_json_object(const AuditLogEntry &entry) {
  nlohmann::json j;
  j["id"] = entry.id;
  j["guild_id"] = std::to_string(entry.guild_id);
  j["user_id"] = std::to_string(entry.user_id);
  j["channel_id"] = std::to_string(entry.channel_id);
  j["message_id"] = std::to_string(entry.message_id);
  j["action"] = action_type_to_string(entry.action);

  nlohmann::json rules = nlohmann::json::array();
  for (RuleId rule : entry.triggering_rules)
    rules.push_back(rule_id_to_string(rule));
  j["triggering_rules"] = rules;

  j["confidence"] = entry.confidence;
  j["duration_seconds"] = entry.duration_seconds;
  j["moderator_id"] = entry.moderator_id
                          ? nlohmann::json(std::to_string(*entry.moderator_id))
                          : nlohmann::json(nullptr);
  j["reason"] = entry.reason;
  j["decided_at_ms"] = entry.decided_at_ms;
  j["timestamp_ms"] = entry.timestamp_ms;
  j["success"] = entry.success;
  j["total_attempts"] = entry.total_attempts;

  nlohmann::json calls = nlohmann::json::array();
  for (const auto &call : entry.calls)
    calls.push_back(call_outcome_to_json_object(call));
  j["calls"] = calls;
  if (!entry.error.empty())
    j["error"] = entry.error;
  return j;
}

nlohmann::json JsonFormatter::decision_to_json_object(const Decision &decision) {
  nlohmann::json j;
  j["guild_id"] = std::to_string(decision.guild_id);
  j["channel_id"] = std::to_string(decision.channel_id);
  j["user_id"] = std::to_string(decision.user_id);
  j["message_id"] = std::to_string(decision.message_id);
  j["sensitivity"] = Config::sensitivity_to_string(decision.sensitivity);
  j["stage"] = decision_stage_to_string(decision.stage);
  j["action"] = action_type_to_string(decision.action);
  j["combined_confidence"] = decision.combined_confidence;
  j["risk_multiplier"] = decision.risk_multiplier;
  j["duration_seconds"] = decision.duration_seconds;
  j["offense_count"] = decision.offense_count;

  nlohmann::json rules = nlohmann::json::array();
  for (RuleId rule : decision.triggering_rules)
    rules.push_back(rule_id_to_string(rule));
  j["triggering_rules"] = rules;

  nlohmann::json signals = nlohmann::json::array();
  for (const auto &signal : decision.signals) {
    nlohmann::json evidence_ids = nlohmann::json::array();
    for (uint64_t id : signal.evidence_message_ids)
      evidence_ids.push_back(std::to_string(id));
    signals.push_back({{"rule", rule_id_to_string(signal.rule)},
                       {"confidence", signal.confidence},
                       {"evidence", signal.evidence},
                       {"evidence_message_ids", evidence_ids}});
  }
  j["signals"] = signals;
  j["decided_at_ms"] = decision.decided_at_ms;

  if (decision.outcome) {
    nlohmann::json calls = nlohmann::json::array();
    for (const auto &call : decision.outcome->calls)
      calls.push_back(call_outcome_to_json_object(call));
    j["outcome"] = {{"success", decision.outcome->success},
                    {"total_attempts", decision.outcome->total_attempts},
                    {"completed_at_ms", decision.outcome->completed_at_ms},
                    {"calls", calls}};
    if (!decision.outcome->error.empty())
      j["outcome"]["error"] = decision.outcome->error;
  }
  return j;
}

std::string JsonFormatter::dump_safe(const nlohmann::json &j, int indent) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string JsonFormatter::format_audit_entry_to_json(const AuditLogEntry &entry) {
  return dump_safe(audit_entry_to_json_object(entry));
}

std::optional<AuditLogEntry>
JsonFormatter::audit_entry_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;

  auto id = read_u64(j, "id");
  auto guild_id = read_u64(j, "guild_id");
  auto user_id = read_u64(j, "user_id");
  auto timestamp = read_u64(j, "timestamp_ms");
  auto action = parse_action_type(read_or<std::string>(j, "action", ""));
  if (!id || !guild_id || !user_id || !timestamp || !action)
    return std::nullopt;

  AuditLogEntry entry;
  entry.id = *id;
  entry.guild_id = *guild_id;
  entry.user_id = *user_id;
  entry.channel_id = read_u64(j, "channel_id").value_or(0);
  entry.message_id = read_u64(j, "message_id").value_or(0);
  entry.action = *action;

  auto rules_it = j.find("triggering_rules");
  if (rules_it != j.end() && rules_it->is_array())
    for (const auto &rule : *rules_it)
      if (rule.is_string())
        if (auto parsed = parse_rule_id(rule.get<std::string>()))
          entry.triggering_rules.push_back(*parsed);

  entry.confidence = read_or<double>(j, "confidence", 0.0);
  entry.duration_seconds = read_u64(j, "duration_seconds").value_or(0);
  entry.moderator_id = read_u64(j, "moderator_id");
  entry.reason = read_or<std::string>(j, "reason", "");
  entry.decided_at_ms = read_u64(j, "decided_at_ms").value_or(*timestamp);
  entry.timestamp_ms = *timestamp;
  entry.success = read_or<bool>(j, "success", false);
  entry.total_attempts = read_or<size_t>(j, "total_attempts", 0);
  entry.error = read_or<std::string>(j, "error", "");

  auto calls_it = j.find("calls");
  if (calls_it != j.end() && calls_it->is_array()) {
    for (const auto &call_json : *calls_it) {
      if (!call_json.is_object())
        continue;
      auto kind = parse_api_call_kind(read_or<std::string>(call_json, "kind", ""));
      if (!kind)
        continue;
      CallOutcome call;
      call.kind = *kind;
      call.success = read_or<bool>(call_json, "success", false);
      call.attempts = read_or<size_t>(call_json, "attempts", 0);
      call.last_status = read_or<int>(call_json, "last_status", 0);
      call.error = read_or<std::string>(call_json, "error", "");
      entry.calls.push_back(std::move(call));
    }
  }
  return entry;
}
