#include "message_event.hpp"
#include "utils/utils.hpp"

namespace {

std::optional<uint64_t> read_id(const nlohmann::json &j, const char *field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (it->is_number_unsigned())
    return it->get<uint64_t>();
  if (it->is_number_integer()) {
    auto value = it->get<int64_t>();
    if (value < 0)
      return std::nullopt;
    return static_cast<uint64_t>(value);
  }
  if (it->is_string())
    return Utils::string_to_number<uint64_t>(it->get<std::string>());
  return std::nullopt;
}

uint32_t read_count(const nlohmann::json &j, const char *field) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_number_integer())
    return 0;
  auto value = it->get<int64_t>();
  return value < 0 ? 0 : static_cast<uint32_t>(value);
}

} // namespace

std::optional<uint64_t> MessageEvent::account_age_ms() const {
  if (!account_created_at_ms)
    return std::nullopt;
  return received_at_ms > *account_created_at_ms
             ? received_at_ms - *account_created_at_ms
             : 0;
}

std::optional<uint64_t> MessageEvent::membership_age_ms() const {
  if (!joined_at_ms)
    return std::nullopt;
  return received_at_ms > *joined_at_ms ? received_at_ms - *joined_at_ms : 0;
}

std::optional<MessageEvent> MessageEvent::from_json(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;

  auto message_id = read_id(j, "message_id");
  auto guild_id = read_id(j, "guild_id");
  auto channel_id = read_id(j, "channel_id");
  auto author_id = read_id(j, "author_id");
  if (!message_id || !guild_id || !channel_id || !author_id)
    return std::nullopt;

  MessageEvent event;
  event.message_id = *message_id;
  event.guild_id = *guild_id;
  event.channel_id = *channel_id;
  event.author_id = *author_id;

  auto content_it = j.find("content");
  if (content_it != j.end() && content_it->is_string())
    event.content = content_it->get<std::string>();

  event.attachment_count = read_count(j, "attachment_count");
  event.sticker_count = read_count(j, "sticker_count");
  event.account_created_at_ms = read_id(j, "account_created_at_ms");
  event.joined_at_ms = read_id(j, "joined_at_ms");
  event.received_at_ms =
      read_id(j, "received_at_ms").value_or(Utils::get_current_time_ms());
  return event;
}

nlohmann::json MessageEvent::to_json() const {
  nlohmann::json j;
  j["message_id"] = std::to_string(message_id);
  j["guild_id"] = std::to_string(guild_id);
  j["channel_id"] = std::to_string(channel_id);
  j["author_id"] = std::to_string(author_id);
  j["content"] = content;
  j["attachment_count"] = attachment_count;
  j["sticker_count"] = sticker_count;
  if (account_created_at_ms)
    j["account_created_at_ms"] = *account_created_at_ms;
  if (joined_at_ms)
    j["joined_at_ms"] = *joined_at_ms;
  j["received_at_ms"] = received_at_ms;
  return j;
}

std::optional<IngestEvent> parse_ingest_line(std::string_view line) {
  auto j = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object())
    return std::nullopt;

  std::string type = "message_create";
  auto type_it = j.find("type");
  if (type_it != j.end() && type_it->is_string())
    type = type_it->get<std::string>();

  IngestEvent event;
  if (type == "message_delete") {
    auto message_id = read_id(j, "message_id");
    if (!message_id)
      return std::nullopt;
    event.type = IngestEventType::MESSAGE_DELETE;
    event.deleted_message_id = *message_id;
    return event;
  }

  if (type != "message_create")
    return std::nullopt;

  auto message = MessageEvent::from_json(j);
  if (!message)
    return std::nullopt;
  event.type = IngestEventType::MESSAGE_CREATE;
  event.message = std::move(*message);
  return event;
}
