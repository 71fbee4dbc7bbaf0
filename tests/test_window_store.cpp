#include "analysis/window_store.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace {

constexpr uint64_t BASE_TS = 1700000000000ULL;

MessageEvent make_event(uint64_t message_id, uint64_t ts,
                        const std::string &content = "hello",
                        uint64_t guild = 1, uint64_t user = 2) {
  MessageEvent event;
  event.message_id = message_id;
  event.guild_id = guild;
  event.channel_id = 10;
  event.author_id = user;
  event.content = content;
  event.received_at_ms = ts;
  return event;
}

} // namespace

TEST(WindowStoreTest, SnapshotContainsSubjectAndHistory) {
  WindowStore store(600000, 50, 4);
  store.record(make_event(1, BASE_TS));
  store.record(make_event(2, BASE_TS + 1000));
  WindowSnapshot snapshot = store.record(make_event(3, BASE_TS + 2000, "Hi"));

  ASSERT_EQ(snapshot.entries->size(), 3u);
  EXPECT_EQ(snapshot.subject->message_id, 3u);
  EXPECT_EQ(snapshot.subject_index(), 2u);
  EXPECT_TRUE(snapshot.subject_in_window());
  EXPECT_EQ(snapshot.subject_fingerprint->normalized, "hi");
  EXPECT_EQ(snapshot.entries->back().fingerprint, snapshot.subject_fingerprint);
  EXPECT_NO_THROW(snapshot.validate(50));
}

TEST(WindowStoreTest, SnapshotIsUnaffectedByLaterAppends) {
  WindowStore store(600000, 50, 4);
  WindowSnapshot first = store.record(make_event(1, BASE_TS));
  store.record(make_event(2, BASE_TS + 1));
  EXPECT_EQ(first.entries->size(), 1u);
  EXPECT_EQ(store.window_size({1, 2}), 2u);
}

TEST(WindowStoreTest, EnforcesCountBound) {
  WindowStore store(600000, 5, 4);
  WindowSnapshot snapshot;
  for (uint64_t i = 1; i <= 8; ++i)
    snapshot = store.record(make_event(i, BASE_TS + i));
  ASSERT_EQ(snapshot.entries->size(), 5u);
  EXPECT_EQ(snapshot.entries->front().message_id, 4u);
  EXPECT_EQ(snapshot.entries->back().message_id, 8u);
}

TEST(WindowStoreTest, EnforcesTimeBound) {
  WindowStore store(10000, 50, 4);
  store.record(make_event(1, BASE_TS));
  store.record(make_event(2, BASE_TS + 5000));
  WindowSnapshot snapshot = store.record(make_event(3, BASE_TS + 12000));
  ASSERT_EQ(snapshot.entries->size(), 2u);
  EXPECT_EQ(snapshot.entries->front().message_id, 2u);
}

TEST(WindowStoreTest, PartitionsAreIndependent) {
  WindowStore store(600000, 50, 4);
  store.record(make_event(1, BASE_TS, "a", 1, 2));
  store.record(make_event(2, BASE_TS, "a", 1, 3));
  store.record(make_event(3, BASE_TS, "a", 9, 2));
  EXPECT_EQ(store.window_count(), 3u);
  EXPECT_EQ(store.window_size({1, 2}), 1u);
  EXPECT_EQ(store.window_size({1, 3}), 1u);
  EXPECT_EQ(store.window_size({9, 2}), 1u);
}

TEST(WindowStoreTest, LateArrivalIsPlacedInOrder) {
  WindowStore store(600000, 50, 4);
  store.record(make_event(1, BASE_TS));
  store.record(make_event(3, BASE_TS + 3000));
  WindowSnapshot snapshot = store.record(make_event(2, BASE_TS + 2000));

  ASSERT_EQ(snapshot.entries->size(), 3u);
  EXPECT_EQ((*snapshot.entries)[1].message_id, 2u);
  EXPECT_EQ(snapshot.subject_index(), 1u);
  EXPECT_NO_THROW(snapshot.validate(50));
}

TEST(WindowStoreTest, LateArrivalBeyondCountBoundIsNotAFault) {
  WindowStore store(600000, 2, 4);
  store.record(make_event(2, BASE_TS + 2000));
  store.record(make_event(3, BASE_TS + 3000));
  WindowSnapshot snapshot = store.record(make_event(1, BASE_TS + 1000));

  EXPECT_FALSE(snapshot.subject_in_window());
  EXPECT_EQ(snapshot.subject_index(), snapshot.entries->size());
  EXPECT_NO_THROW(snapshot.validate(2));
}

TEST(WindowStoreTest, ValidateDetectsBrokenInvariants) {
  WindowSnapshot snapshot;
  snapshot.key = {1, 2};
  snapshot.subject = std::make_shared<const MessageEvent>(make_event(1, 10));
  snapshot.subject_fingerprint = std::make_shared<const Fingerprint>();

  std::vector<WindowEntry> out_of_order = {{20, 1, 10, nullptr},
                                           {10, 2, 10, nullptr}};
  snapshot.entries =
      std::make_shared<const std::vector<WindowEntry>>(out_of_order);
  EXPECT_THROW(snapshot.validate(50), PartitionFault);

  std::vector<WindowEntry> too_many(3, WindowEntry{10, 1, 10, nullptr});
  snapshot.entries = std::make_shared<const std::vector<WindowEntry>>(too_many);
  try {
    snapshot.validate(2);
    FAIL() << "expected PartitionFault";
  } catch (const PartitionFault &fault) {
    EXPECT_EQ(fault.key(), (GuildUserKey{1, 2}));
  }
}

TEST(WindowStoreTest, EvictExpiredForgetsIdleWindows) {
  WindowStore store(10000, 50, 4);
  store.record(make_event(1, BASE_TS, "x", 1, 2));
  store.record(make_event(2, BASE_TS + 8000, "x", 1, 3));

  EXPECT_EQ(store.evict_expired(BASE_TS + 15000), 1u);
  EXPECT_EQ(store.window_count(), 1u);
  EXPECT_EQ(store.window_size({1, 2}), 0u);
  EXPECT_EQ(store.evict_expired(BASE_TS + 30000), 1u);
  EXPECT_EQ(store.window_count(), 0u);
}

TEST(WindowStoreTest, ResetClearsOnePartition) {
  WindowStore store(600000, 50, 4);
  store.record(make_event(1, BASE_TS, "x", 1, 2));
  store.record(make_event(2, BASE_TS, "x", 1, 3));
  store.reset({1, 2});
  EXPECT_EQ(store.window_size({1, 2}), 0u);
  EXPECT_EQ(store.window_size({1, 3}), 1u);
}

TEST(WindowStoreTest, ReconfigureAppliesOnNextRecord) {
  WindowStore store(600000, 50, 4);
  for (uint64_t i = 1; i <= 10; ++i)
    store.record(make_event(i, BASE_TS + i));
  store.reconfigure(600000, 3, 256);
  WindowSnapshot snapshot = store.record(make_event(11, BASE_TS + 11));
  EXPECT_EQ(snapshot.entries->size(), 3u);
}

TEST(WindowStoreTest, ConcurrentRecordsForDistinctUsers) {
  WindowStore store(600000, 50, 8);
  std::vector<std::thread> threads;
  for (uint64_t user = 1; user <= 8; ++user) {
    threads.emplace_back([&store, user] {
      for (uint64_t i = 0; i < 100; ++i)
        store.record(make_event(user * 1000 + i, BASE_TS + i, "spam", 1, user));
    });
  }
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(store.window_count(), 8u);
  for (uint64_t user = 1; user <= 8; ++user)
    EXPECT_EQ(store.window_size({1, user}), 50u);
}
