#ifndef OFFENSE_STORE_HPP
#define OFFENSE_STORE_HPP

#include "analysis/window_store.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

struct OffenseRecord {
  uint32_t mute_count = 0; // mutes inside the current escalation window
  uint64_t last_mute_ms = 0;
  uint64_t last_duration_seconds = 0;
};

// Per (guild, user) mute history used for escalation, sharded like the
// window store
class OffenseStore {
public:
  explicit OffenseStore(size_t shard_count = 64);

  OffenseStore(const OffenseStore &) = delete;
  OffenseStore &operator=(const OffenseStore &) = delete;

  std::optional<OffenseRecord> get(const GuildUserKey &key) const;

  // Stores the record produced by a mute decision. A record older than the
  // stored one keeps the newer timestamp and the higher count.
  void commit_mute(const GuildUserKey &key, const OffenseRecord &record);

  // Forgets records whose last mute is older than the escalation window
  size_t evict_expired(uint64_t now_ms, uint64_t escalation_window_ms);

  void reset(const GuildUserKey &key);
  size_t size() const;

private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<GuildUserKey, OffenseRecord, GuildUserKeyHash> records;
  };

  Shard &shard_for(const GuildUserKey &key);
  const Shard &shard_for(const GuildUserKey &key) const;

  std::vector<std::unique_ptr<Shard>> shards_;
};

#endif // OFFENSE_STORE_HPP
