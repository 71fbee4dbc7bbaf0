#ifndef WINDOW_STORE_HPP
#define WINDOW_STORE_HPP

#include "analysis/fingerprint.hpp"
#include "core/message_event.hpp"
#include "utils/sliding_window.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct GuildUserKey {
  uint64_t guild_id = 0;
  uint64_t user_id = 0;

  bool operator==(const GuildUserKey &other) const {
    return guild_id == other.guild_id && user_id == other.user_id;
  }
  std::string to_string() const;
};

struct GuildUserKeyHash {
  size_t operator()(const GuildUserKey &key) const noexcept;
};

// Internal invariant violation for one (guild, user) partition
class PartitionFault : public std::runtime_error {
public:
  PartitionFault(const GuildUserKey &key, const std::string &what)
      : std::runtime_error("partition " + key.to_string() + ": " + what),
        key_(key) {}
  const GuildUserKey &key() const { return key_; }

private:
  GuildUserKey key_;
};

struct WindowEntry {
  uint64_t timestamp_ms = 0;
  uint64_t message_id = 0;
  uint64_t channel_id = 0;
  std::shared_ptr<const Fingerprint> fingerprint;
};

// Immutable view of one user's window taken right after an append. Entries
// are ordered oldest first. The subject is the message that was recorded.
// A late message that the count bound pushed straight back out is not part
// of entries; subject_index() then returns entries->size().
struct WindowSnapshot {
  GuildUserKey key;
  std::shared_ptr<const MessageEvent> subject;
  std::shared_ptr<const Fingerprint> subject_fingerprint;
  std::shared_ptr<const std::vector<WindowEntry>> entries;

  size_t subject_index() const;
  bool subject_in_window() const { return subject_index() < entries->size(); }

  // Throws PartitionFault when ordering or bounds are broken
  void validate(size_t max_entries) const;
};

// Per (guild, user) bounded message history, sharded so unrelated users
// never contend on the same lock.
class WindowStore {
public:
  WindowStore(uint64_t window_duration_ms, size_t window_max_messages,
              size_t shard_count = 64, size_t fingerprint_max_length = 256);

  WindowStore(const WindowStore &) = delete;
  WindowStore &operator=(const WindowStore &) = delete;

  WindowSnapshot record(const MessageEvent &event);

  // Drops expired entries everywhere and forgets windows left empty.
  // Returns the number of windows removed.
  size_t evict_expired(uint64_t now_ms);

  void reset(const GuildUserKey &key);
  void reconfigure(uint64_t window_duration_ms, size_t window_max_messages,
                   size_t fingerprint_max_length);

  size_t window_count() const;
  size_t window_size(const GuildUserKey &key) const;

private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<GuildUserKey, SlidingWindow<WindowEntry>,
                       GuildUserKeyHash>
        windows;
  };

  Shard &shard_for(const GuildUserKey &key);
  const Shard &shard_for(const GuildUserKey &key) const;

  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<uint64_t> window_duration_ms_;
  std::atomic<size_t> window_max_messages_;
  std::atomic<size_t> fingerprint_max_length_;
};

#endif // WINDOW_STORE_HPP
