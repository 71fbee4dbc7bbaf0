#ifndef SLIDING_WINDOW_HPP
#define SLIDING_WINDOW_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

// Timestamp ordered, bounded event history. Entries older than the
// configured duration or beyond the configured count are pruned, whichever
// bound is reached first. Either bound may be 0 to disable it.
template <typename ValueType> class SlidingWindow {
public:
  SlidingWindow(uint64_t duration_ms, size_t max_elements_limit = 0)
      : configured_duration_ms(duration_ms),
        configured_max_elements(max_elements_limit) {};

  // Appends in O(1) when timestamps arrive in order. A late event is placed
  // at its sorted position so pruning by time stays a prefix erase.
  void add_event(uint64_t event_timestamp_ms, ValueType value) {
    if (window_data.empty() || window_data.back().first <= event_timestamp_ms) {
      window_data.emplace_back(event_timestamp_ms, std::move(value));
      return;
    }

    auto position = std::upper_bound(
        window_data.begin(), window_data.end(), event_timestamp_ms,
        [](uint64_t time, const std::pair<uint64_t, ValueType> &element) {
          return time < element.first;
        });
    window_data.emplace(position, event_timestamp_ms, std::move(value));
  }

  void prune_old_events(uint64_t current_time_ms) {
    // 1. Time based pruning
    if (configured_duration_ms > 0 && !window_data.empty()) {
      uint64_t cutoff_timestamp = 0;
      // Avoid underflow if current_time_ms is less than the duration
      if (current_time_ms >= configured_duration_ms)
        cutoff_timestamp = current_time_ms - configured_duration_ms;

      auto first_to_keep = std::lower_bound(
          window_data.begin(), window_data.end(), cutoff_timestamp,
          [](const std::pair<uint64_t, ValueType> &element, uint64_t time) {
            return element.first < time;
          });

      window_data.erase(window_data.begin(), first_to_keep);
    }

    // 2. Size based pruning
    if (configured_max_elements > 0)
      while (window_data.size() > configured_max_elements)
        window_data.pop_front();
  }

  size_t get_event_count() const { return window_data.size(); }

  bool is_empty() const { return window_data.empty(); }

  std::vector<ValueType> get_all_values_in_window() const {
    std::vector<ValueType> values;
    values.reserve(window_data.size());
    for (const auto &pair : window_data)
      values.push_back(pair.second);
    return values;
  }

  void reconfigure(uint64_t new_duration_ms, size_t new_max_elements = 0) {
    configured_duration_ms = new_duration_ms;
    configured_max_elements = new_max_elements;
  }

  uint64_t duration_ms() const { return configured_duration_ms; }
  size_t max_elements() const { return configured_max_elements; }

private:
  std::deque<std::pair<uint64_t, ValueType>> window_data;
  uint64_t configured_duration_ms;
  size_t configured_max_elements; // 0 means no limit
};

#endif // SLIDING_WINDOW_HPP
