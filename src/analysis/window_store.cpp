#include "window_store.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <functional>

std::string GuildUserKey::to_string() const {
  return std::to_string(guild_id) + ":" + std::to_string(user_id);
}

size_t GuildUserKeyHash::operator()(const GuildUserKey &key) const noexcept {
  return static_cast<size_t>(
      Utils::hash_combine(std::hash<uint64_t>{}(key.guild_id), key.user_id));
}

size_t WindowSnapshot::subject_index() const {
  for (size_t i = entries->size(); i > 0; --i)
    if ((*entries)[i - 1].message_id == subject->message_id)
      return i - 1;
  return entries->size();
}

void WindowSnapshot::validate(size_t max_entries) const {
  if (!subject || !subject_fingerprint || !entries)
    throw PartitionFault(key, "snapshot is missing its subject or entries");
  if (max_entries > 0 && entries->size() > max_entries)
    throw PartitionFault(key, "window holds " +
                                  std::to_string(entries->size()) +
                                  " entries, bound is " +
                                  std::to_string(max_entries));
  for (size_t i = 1; i < entries->size(); ++i)
    if ((*entries)[i - 1].timestamp_ms > (*entries)[i].timestamp_ms)
      throw PartitionFault(key, "window entries are out of order");
}

WindowStore::WindowStore(uint64_t window_duration_ms,
                         size_t window_max_messages, size_t shard_count,
                         size_t fingerprint_max_length)
    : window_duration_ms_(window_duration_ms),
      window_max_messages_(window_max_messages),
      fingerprint_max_length_(fingerprint_max_length) {
  shard_count = std::max<size_t>(1, shard_count);
  shards_.reserve(shard_count);
  for (size_t i = 0; i < shard_count; ++i)
    shards_.push_back(std::make_unique<Shard>());
}

WindowStore::Shard &WindowStore::shard_for(const GuildUserKey &key) {
  return *shards_[GuildUserKeyHash{}(key) % shards_.size()];
}

const WindowStore::Shard &WindowStore::shard_for(const GuildUserKey &key) const {
  return *shards_[GuildUserKeyHash{}(key) % shards_.size()];
}

WindowSnapshot WindowStore::record(const MessageEvent &event) {
  // Fingerprinting happens outside the shard lock
  auto fingerprint = std::make_shared<const Fingerprint>(
      Fingerprint::from_message(event.content, event.attachment_count,
                                event.sticker_count,
                                fingerprint_max_length_.load()));

  WindowSnapshot snapshot;
  snapshot.key = {event.guild_id, event.author_id};
  snapshot.subject = std::make_shared<const MessageEvent>(event);
  snapshot.subject_fingerprint = fingerprint;

  const uint64_t duration_ms = window_duration_ms_.load();
  const size_t max_messages = window_max_messages_.load();

  Shard &shard = shard_for(snapshot.key);
  std::vector<WindowEntry> entries;
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.windows.find(snapshot.key);
    if (it == shard.windows.end())
      it = shard.windows
               .emplace(snapshot.key,
                        SlidingWindow<WindowEntry>(duration_ms, max_messages))
               .first;

    auto &window = it->second;
    if (window.duration_ms() != duration_ms ||
        window.max_elements() != max_messages)
      window.reconfigure(duration_ms, max_messages);

    window.add_event(event.received_at_ms,
                     WindowEntry{event.received_at_ms, event.message_id,
                                 event.channel_id, fingerprint});
    // Pruning relative to the event's own time keeps a late arrival inside
    // its window; newer entries are pruned once the next in-order message
    // or the sweep comes along.
    window.prune_old_events(event.received_at_ms);

    entries = window.get_all_values_in_window();
  }

  snapshot.entries =
      std::make_shared<const std::vector<WindowEntry>>(std::move(entries));

  LOG(LogLevel::TRACE, LogComponent::WINDOW,
      "Recorded message " << event.message_id << " for "
                          << snapshot.key.to_string() << ", window size "
                          << snapshot.entries->size());
  return snapshot;
}

size_t WindowStore::evict_expired(uint64_t now_ms) {
  size_t removed = 0;
  size_t remaining_entries = 0;
  for (auto &shard_ptr : shards_) {
    std::lock_guard<std::mutex> lock(shard_ptr->mutex);
    for (auto it = shard_ptr->windows.begin();
         it != shard_ptr->windows.end();) {
      it->second.prune_old_events(now_ms);
      if (it->second.is_empty()) {
        it = shard_ptr->windows.erase(it);
        ++removed;
      } else {
        remaining_entries += it->second.get_event_count();
        ++it;
      }
    }
  }

  static Gauge *entries_gauge = MetricsManager::instance().register_gauge(
      "gw_window_entries", "Messages currently held across all user windows.");
  entries_gauge->set(static_cast<double>(remaining_entries));

  if (removed > 0)
    LOG(LogLevel::DEBUG, LogComponent::WINDOW,
        "Evicted " << removed << " idle user windows");
  return removed;
}

void WindowStore::reset(const GuildUserKey &key) {
  Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.windows.erase(key);
}

void WindowStore::reconfigure(uint64_t window_duration_ms,
                              size_t window_max_messages,
                              size_t fingerprint_max_length) {
  window_duration_ms_ = window_duration_ms;
  window_max_messages_ = window_max_messages;
  fingerprint_max_length_ = fingerprint_max_length;
}

size_t WindowStore::window_count() const {
  size_t count = 0;
  for (const auto &shard_ptr : shards_) {
    std::lock_guard<std::mutex> lock(shard_ptr->mutex);
    count += shard_ptr->windows.size();
  }
  return count;
}

size_t WindowStore::window_size(const GuildUserKey &key) const {
  const Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.windows.find(key);
  return it == shard.windows.end() ? 0 : it->second.get_event_count();
}
