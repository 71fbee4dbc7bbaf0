#ifndef MESSAGE_EVENT_HPP
#define MESSAGE_EVENT_HPP

#include "nlohmann/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// One inbound chat message as delivered by the ingestion layer
struct MessageEvent {
  uint64_t message_id = 0;
  uint64_t guild_id = 0;
  uint64_t channel_id = 0;
  uint64_t author_id = 0;
  std::string content;
  uint32_t attachment_count = 0;
  uint32_t sticker_count = 0;
  std::optional<uint64_t> account_created_at_ms;
  std::optional<uint64_t> joined_at_ms;
  uint64_t received_at_ms = 0;

  std::optional<uint64_t> account_age_ms() const;
  std::optional<uint64_t> membership_age_ms() const;

  // Accepts ids as JSON numbers or decimal strings. Returns nullopt when a
  // required field is missing or malformed.
  static std::optional<MessageEvent> from_json(const nlohmann::json &j);
  nlohmann::json to_json() const;
};

enum class IngestEventType { MESSAGE_CREATE, MESSAGE_DELETE };

struct IngestEvent {
  IngestEventType type = IngestEventType::MESSAGE_CREATE;
  MessageEvent message;             // MESSAGE_CREATE
  uint64_t deleted_message_id = 0;  // MESSAGE_DELETE
};

// Parses one JSON line: {"type":"message_create", ...} or
// {"type":"message_delete","message_id":...}. A missing type means create.
std::optional<IngestEvent> parse_ingest_line(std::string_view line);

#endif // MESSAGE_EVENT_HPP
