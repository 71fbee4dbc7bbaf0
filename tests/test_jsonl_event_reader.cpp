#include "io/event_readers/jsonl_event_reader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace {

std::string create_line(uint64_t message_id, const std::string &content) {
  return R"({"message_id":")" + std::to_string(message_id) +
         R"(","guild_id":"1","channel_id":"2","author_id":"3","content":")" +
         content + R"(","received_at_ms":1000})";
}

} // namespace

TEST(JsonLinesEventReaderTest, ReadsEventsAndSkipsMalformedLines) {
  std::istringstream input(create_line(10, "hello") + "\n" +
                           "{not json\n" + "\n" +
                           R"({"type":"message_delete","message_id":"10"})" +
                           "\n" + R"({"type":"reaction_add"})" + "\n" +
                           create_line(11, "world") + "\n");
  JsonLinesEventReader reader(input, false);

  auto batch = reader.get_next_batch();
  ASSERT_EQ(batch.size(), 3u);
  EXPECT_EQ(batch[0].type, IngestEventType::MESSAGE_CREATE);
  EXPECT_EQ(batch[0].message.message_id, 10u);
  EXPECT_EQ(batch[0].message.content, "hello");
  EXPECT_EQ(batch[1].type, IngestEventType::MESSAGE_DELETE);
  EXPECT_EQ(batch[1].deleted_message_id, 10u);
  EXPECT_EQ(batch[2].message.message_id, 11u);

  EXPECT_TRUE(reader.is_finished());
  EXPECT_EQ(reader.lines_read(), 5u); // blank line not counted
  EXPECT_EQ(reader.malformed_lines(), 2u);
  EXPECT_TRUE(reader.get_next_batch().empty());
}

TEST(JsonLinesEventReaderTest, LastLineWithoutNewlineIsParsedAtEnd) {
  std::istringstream input(create_line(1, "a") + "\n" + create_line(2, "b"));
  JsonLinesEventReader reader(input, false);

  auto batch = reader.get_next_batch();
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[1].message.message_id, 2u);
  EXPECT_TRUE(reader.is_finished());
}

TEST(JsonLinesEventReaderTest, FollowModeWaitsForCompleteLine) {
  std::stringstream stream;
  std::string line = create_line(5, "tail");
  stream << line.substr(0, 20);

  JsonLinesEventReader reader(stream, true);
  EXPECT_TRUE(reader.get_next_batch().empty());
  EXPECT_FALSE(reader.is_finished());

  stream << line.substr(20) << "\n";
  auto batch = reader.get_next_batch();
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch[0].message.message_id, 5u);
  EXPECT_EQ(batch[0].message.content, "tail");
  EXPECT_EQ(reader.malformed_lines(), 0u);
  EXPECT_FALSE(reader.is_finished());
}

TEST(JsonLinesEventReaderTest, ReadsFromFile) {
  auto path = std::filesystem::temp_directory_path() /
              ("gw_events_" + std::to_string(::getpid()) + ".jsonl");
  {
    std::ofstream out(path);
    for (uint64_t id = 1; id <= 3; ++id)
      out << create_line(id, "msg") << "\n";
  }

  {
    JsonLinesEventReader reader(path.string(), false);
    auto batch = reader.get_next_batch();
    EXPECT_EQ(batch.size(), 3u);
    EXPECT_TRUE(reader.is_finished());
  }
  std::filesystem::remove(path);
}

TEST(JsonLinesEventReaderTest, MissingFileThrows) {
  EXPECT_THROW(JsonLinesEventReader("/nonexistent/dir/events.jsonl", false),
               std::runtime_error);
}
