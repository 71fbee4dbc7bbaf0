#include "utils/sliding_window.hpp"

#include <gtest/gtest.h>

TEST(SlidingWindowTest, PrunesCorrectly) {
  // Test that pruning correctly removes old items based on timestamp
  SlidingWindow<int> window(1000, 0); // 1-second window

  window.add_event(100, 1);
  window.add_event(200, 2);
  window.add_event(1100, 3);
  window.add_event(1200, 4);

  // Cutoff is 150ms, the event at 100 goes
  window.prune_old_events(1150);
  ASSERT_EQ(window.get_event_count(), 3)
      << "Should keep events at 200, 1100, 1200";
  ASSERT_EQ(window.get_all_values_in_window().front(), 2);

  // Cutoff is 1100ms, the event at 200 goes
  window.prune_old_events(2100);
  ASSERT_EQ(window.get_event_count(), 2) << "Should keep events at 1100, 1200";
  ASSERT_EQ(window.get_all_values_in_window().front(), 3);

  window.prune_old_events(3000);
  ASSERT_EQ(window.get_event_count(), 0);
  ASSERT_TRUE(window.is_empty());
}

TEST(SlidingWindowTest, HandlesEmptyWindow) {
  SlidingWindow<int> window(1000, 0);
  ASSERT_NO_THROW(window.prune_old_events(5000));
  ASSERT_EQ(window.get_event_count(), 0);
}

TEST(SlidingWindowTest, CountBoundDropsOldest) {
  SlidingWindow<int> window(0, 3); // no time bound
  for (int i = 1; i <= 5; ++i) {
    window.add_event(static_cast<uint64_t>(i) * 10, i);
    window.prune_old_events(static_cast<uint64_t>(i) * 10);
  }
  auto values = window.get_all_values_in_window();
  ASSERT_EQ(values.size(), 3u);
  EXPECT_EQ(values.front(), 3);
  EXPECT_EQ(values.back(), 5);
}

TEST(SlidingWindowTest, LateEventIsInsertedInOrder) {
  SlidingWindow<int> window(10000, 0);
  window.add_event(100, 1);
  window.add_event(300, 3);
  window.add_event(200, 2); // arrives late

  auto values = window.get_all_values_in_window();
  ASSERT_EQ(values.size(), 3u);
  EXPECT_EQ(values[0], 1);
  EXPECT_EQ(values[1], 2);
  EXPECT_EQ(values[2], 3);

  // Pruning by time still removes a prefix after the late insert
  window.prune_old_events(10150);
  values = window.get_all_values_in_window();
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0], 2);
}

TEST(SlidingWindowTest, ReconfigureTightensBounds) {
  SlidingWindow<int> window(10000, 0);
  for (int i = 0; i < 10; ++i)
    window.add_event(static_cast<uint64_t>(i) * 100, i);
  window.reconfigure(10000, 4);
  window.prune_old_events(900);
  EXPECT_EQ(window.get_event_count(), 4u);
  EXPECT_EQ(window.max_elements(), 4u);
}
