#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/audit_entry.hpp"
#include "core/decision.hpp"
#include "nlohmann/json.hpp"

#include <optional>
#include <string>

namespace JsonFormatter {

nlohmann::json call_outcome_to_json_object(const CallOutcome &call);
nlohmann::json audit_entry_to_json_object(const AuditLogEntry &entry);
nlohmann::json decision_to_json_object(const Decision &decision);

// Single-line JSON; invalid UTF-8 in free text is replaced, never thrown on
std::string format_audit_entry_to_json(const AuditLogEntry &entry);
std::string dump_safe(const nlohmann::json &j, int indent = -1);

// Inverse of audit_entry_to_json_object; nullopt when required fields are
// missing or malformed
std::optional<AuditLogEntry> audit_entry_from_json(const nlohmann::json &j);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
