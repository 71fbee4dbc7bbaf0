#include "offense_store.hpp"
#include "core/logger.hpp"

#include <algorithm>

OffenseStore::OffenseStore(size_t shard_count) {
  shard_count = std::max<size_t>(1, shard_count);
  shards_.reserve(shard_count);
  for (size_t i = 0; i < shard_count; ++i)
    shards_.push_back(std::make_unique<Shard>());
}

OffenseStore::Shard &OffenseStore::shard_for(const GuildUserKey &key) {
  return *shards_[GuildUserKeyHash{}(key) % shards_.size()];
}

const OffenseStore::Shard &
OffenseStore::shard_for(const GuildUserKey &key) const {
  return *shards_[GuildUserKeyHash{}(key) % shards_.size()];
}

std::optional<OffenseRecord> OffenseStore::get(const GuildUserKey &key) const {
  const Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.records.find(key);
  if (it == shard.records.end())
    return std::nullopt;
  return it->second;
}

void OffenseStore::commit_mute(const GuildUserKey &key,
                               const OffenseRecord &record) {
  Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto inserted = shard.records.emplace(key, record);
  if (inserted.second)
    return;

  OffenseRecord &current = inserted.first->second;
  if (record.last_mute_ms >= current.last_mute_ms) {
    current = record;
    return;
  }
  // A late mute never moves the window back or lowers the count
  current.mute_count = std::max(current.mute_count, record.mute_count);
  current.last_duration_seconds =
      std::max(current.last_duration_seconds, record.last_duration_seconds);
}

size_t OffenseStore::evict_expired(uint64_t now_ms,
                                   uint64_t escalation_window_ms) {
  size_t removed = 0;
  for (auto &shard_ptr : shards_) {
    std::lock_guard<std::mutex> lock(shard_ptr->mutex);
    for (auto it = shard_ptr->records.begin();
         it != shard_ptr->records.end();) {
      if (it->second.last_mute_ms + escalation_window_ms < now_ms) {
        it = shard_ptr->records.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0)
    LOG(LogLevel::DEBUG, LogComponent::ESCALATION,
        "Evicted " << removed << " expired offense records");
  return removed;
}

void OffenseStore::reset(const GuildUserKey &key) {
  Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.records.erase(key);
}

size_t OffenseStore::size() const {
  size_t count = 0;
  for (const auto &shard_ptr : shards_) {
    std::lock_guard<std::mutex> lock(shard_ptr->mutex);
    count += shard_ptr->records.size();
  }
  return count;
}
