#include "core/message_event.hpp"

#include <gtest/gtest.h>

TEST(MessageEventTest, ParsesIdsAsStringsOrNumbers) {
  auto j = nlohmann::json::parse(R"({
    "message_id": "1100000000000000001",
    "guild_id": 42,
    "channel_id": "7",
    "author_id": 9,
    "content": "hello",
    "attachment_count": 2,
    "account_created_at_ms": 1000,
    "received_at_ms": 5000
  })");
  auto event = MessageEvent::from_json(j);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->message_id, 1100000000000000001ULL);
  EXPECT_EQ(event->guild_id, 42u);
  EXPECT_EQ(event->channel_id, 7u);
  EXPECT_EQ(event->author_id, 9u);
  EXPECT_EQ(event->content, "hello");
  EXPECT_EQ(event->attachment_count, 2u);
  EXPECT_EQ(event->sticker_count, 0u);
  EXPECT_EQ(event->account_age_ms(), 4000u);
  EXPECT_FALSE(event->membership_age_ms().has_value());
}

TEST(MessageEventTest, RejectsMissingOrNegativeIds) {
  EXPECT_FALSE(MessageEvent::from_json(nlohmann::json::parse(
                   R"({"guild_id":1,"channel_id":2,"author_id":3})"))
                   .has_value());
  EXPECT_FALSE(MessageEvent::from_json(
                   nlohmann::json::parse(R"({"message_id":-1,"guild_id":1,
                     "channel_id":2,"author_id":3})"))
                   .has_value());
  EXPECT_FALSE(MessageEvent::from_json(nlohmann::json::array()).has_value());
}

TEST(MessageEventTest, AgesClampAtZero) {
  MessageEvent event;
  event.received_at_ms = 1000;
  event.joined_at_ms = 5000; // clock skew
  EXPECT_EQ(event.membership_age_ms(), 0u);
}

TEST(MessageEventTest, ParsesIngestLines) {
  auto create = parse_ingest_line(
      R"({"message_id":1,"guild_id":2,"channel_id":3,"author_id":4})");
  ASSERT_TRUE(create.has_value());
  EXPECT_EQ(create->type, IngestEventType::MESSAGE_CREATE);
  EXPECT_EQ(create->message.author_id, 4u);
  EXPECT_GT(create->message.received_at_ms, 0u);

  auto removal = parse_ingest_line(R"({"type":"message_delete","message_id":"77"})");
  ASSERT_TRUE(removal.has_value());
  EXPECT_EQ(removal->type, IngestEventType::MESSAGE_DELETE);
  EXPECT_EQ(removal->deleted_message_id, 77u);

  EXPECT_FALSE(parse_ingest_line("not json").has_value());
  EXPECT_FALSE(parse_ingest_line(R"({"type":"reaction_add","message_id":1})")
                   .has_value());
}

TEST(MessageEventTest, SerializesIdsAsStrings) {
  MessageEvent event;
  event.message_id = 1;
  event.guild_id = 2;
  event.channel_id = 3;
  event.author_id = 4;
  event.received_at_ms = 10;
  auto j = event.to_json();
  EXPECT_EQ(j["guild_id"], "2");
  EXPECT_FALSE(j.contains("joined_at_ms"));

  auto parsed = MessageEvent::from_json(j);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->guild_id, 2u);
  EXPECT_EQ(parsed->received_at_ms, 10u);
}
