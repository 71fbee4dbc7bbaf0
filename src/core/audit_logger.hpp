#ifndef AUDIT_LOGGER_HPP
#define AUDIT_LOGGER_HPP

#include "audit_entry.hpp"
#include "config.hpp"
#include "decision.hpp"
#include "io/audit/base_audit_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Writes one entry per terminal decision to the durable store, then makes
// it queryable from an in-memory per-guild index. Queries take a shared
// lock on the index only, so they never wait on a store write.
class AuditLogger {
public:
  AuditLogger(std::unique_ptr<IAuditStore> store,
              const Config::AuditConfig &config);

  // Reloads the newest stored entries into the index. Returns the count.
  size_t initialize();

  // Returns the recorded entry, or nullopt for a none decision that is not
  // audited under the current settings
  std::optional<AuditLogEntry> record_decision(const Decision &decision);

  AuditLogEntry record_manual_action(uint64_t guild_id, uint64_t user_id,
                                     uint64_t moderator_id, ActionType action,
                                     uint64_t duration_seconds,
                                     const std::string &reason);

  // Newest first
  std::vector<AuditLogEntry> query(uint64_t guild_id,
                                   const AuditQueryFilter &filter,
                                   size_t limit) const;

  size_t entry_count(uint64_t guild_id) const;
  void reconfigure(const Config::AuditConfig &config);

private:
  AuditLogEntry append(AuditLogEntry entry);
  void index_entry(const AuditLogEntry &entry);

  std::unique_ptr<IAuditStore> store_;
  std::mutex append_mutex_; // orders id assignment with the store write
  uint64_t next_id_ = 1;

  mutable std::shared_mutex index_mutex_;
  std::unordered_map<uint64_t, std::deque<AuditLogEntry>> index_;

  std::atomic<size_t> max_entries_per_guild_;
  std::atomic<bool> log_none_decisions_;
};

#endif // AUDIT_LOGGER_HPP
