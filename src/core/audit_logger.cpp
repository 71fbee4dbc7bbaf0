#include "audit_logger.hpp"
#include "logger.hpp"
#include "metrics_manager.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace {

bool ordered_before(const AuditLogEntry &a, const AuditLogEntry &b) {
  if (a.timestamp_ms != b.timestamp_ms)
    return a.timestamp_ms < b.timestamp_ms;
  return a.id < b.id;
}

} // namespace

AuditLogger::AuditLogger(std::unique_ptr<IAuditStore> store,
                         const Config::AuditConfig &config)
    : store_(std::move(store)),
      max_entries_per_guild_(config.max_entries_per_guild),
      log_none_decisions_(config.log_none_decisions) {}

size_t AuditLogger::initialize() {
  if (!store_)
    return 0;

  std::vector<AuditLogEntry> entries;
  {
    std::lock_guard<std::mutex> lock(append_mutex_);
    entries = store_->load_recent(0);
    for (const auto &entry : entries)
      next_id_ = std::max(next_id_, entry.id + 1);
  }
  for (const auto &entry : entries)
    index_entry(entry);

  LOG(LogLevel::INFO, LogComponent::IO_AUDIT,
      "Loaded " << entries.size() << " audit entries from "
                << store_->get_name() << ", next id " << next_id_);
  return entries.size();
}

void AuditLogger::reconfigure(const Config::AuditConfig &config) {
  max_entries_per_guild_ = config.max_entries_per_guild;
  log_none_decisions_ = config.log_none_decisions;
}

AuditLogEntry AuditLogger::append(AuditLogEntry entry) {
  static LabeledCounter *entries_written =
      MetricsManager::instance().register_labeled_counter(
          "gw_audit_entries_total", "Audit entries recorded, by action.");
  static LabeledCounter *write_failures =
      MetricsManager::instance().register_labeled_counter(
          "gw_audit_write_failures_total",
          "Audit entries the durable store failed to persist.");

  {
    std::lock_guard<std::mutex> lock(append_mutex_);
    entry.id = next_id_++;
    bool stored = store_ && store_->append(entry);
    if (!stored) {
      write_failures->increment();
      LOG(LogLevel::ERROR, LogComponent::IO_AUDIT,
          "Audit entry " << entry.id << " for user " << entry.user_id
                         << " in guild " << entry.guild_id
                         << " was not persisted; kept in memory only.");
    }
  }

  index_entry(entry);
  entries_written->increment({{"action", action_type_to_string(entry.action)}});
  return entry;
}

void AuditLogger::index_entry(const AuditLogEntry &entry) {
  std::unique_lock<std::shared_mutex> lock(index_mutex_);
  auto &entries = index_[entry.guild_id];
  if (entries.empty() || !ordered_before(entry, entries.back()))
    entries.push_back(entry);
  else
    entries.insert(std::upper_bound(entries.begin(), entries.end(), entry,
                                    ordered_before),
                   entry);

  const size_t max_entries = max_entries_per_guild_.load();
  while (max_entries > 0 && entries.size() > max_entries)
    entries.pop_front();
}

std::optional<AuditLogEntry>
AuditLogger::record_decision(const Decision &decision) {
  if (!decision.is_actionable() && !log_none_decisions_)
    return std::nullopt;

  AuditLogEntry entry = append(AuditLogEntry::from_decision(decision));
  LOG(LogLevel::DEBUG, LogComponent::IO_AUDIT,
      "Audited " << action_type_to_string(entry.action) << " #" << entry.id
                 << " for user " << entry.user_id << " in guild "
                 << entry.guild_id << (entry.success ? "" : " (failed)"));
  return entry;
}

AuditLogEntry AuditLogger::record_manual_action(
    uint64_t guild_id, uint64_t user_id, uint64_t moderator_id,
    ActionType action, uint64_t duration_seconds, const std::string &reason) {
  AuditLogEntry entry;
  entry.guild_id = guild_id;
  entry.user_id = user_id;
  entry.action = action;
  entry.confidence = 1.0;
  entry.duration_seconds = duration_seconds;
  entry.moderator_id = moderator_id;
  entry.reason = reason;
  entry.decided_at_ms = Utils::get_current_time_ms();
  entry.timestamp_ms = entry.decided_at_ms;
  entry.success = true;

  LOG(LogLevel::INFO, LogComponent::IO_AUDIT,
      "Moderator " << moderator_id << " recorded "
                   << action_type_to_string(action) << " for user " << user_id
                   << " in guild " << guild_id);
  return append(std::move(entry));
}

std::vector<AuditLogEntry> AuditLogger::query(uint64_t guild_id,
                                              const AuditQueryFilter &filter,
                                              size_t limit) const {
  std::vector<AuditLogEntry> results;
  if (limit == 0)
    return results;

  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  auto it = index_.find(guild_id);
  if (it == index_.end())
    return results;

  for (auto entry = it->second.rbegin();
       entry != it->second.rend() && results.size() < limit; ++entry) {
    if (filter.since_ms && entry->timestamp_ms < *filter.since_ms)
      break;
    if (filter.matches(*entry))
      results.push_back(*entry);
  }
  return results;
}

size_t AuditLogger::entry_count(uint64_t guild_id) const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  auto it = index_.find(guild_id);
  return it == index_.end() ? 0 : it->second.size();
}
