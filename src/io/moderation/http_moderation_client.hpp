#ifndef HTTP_MODERATION_CLIENT_HPP
#define HTTP_MODERATION_CLIENT_HPP

#include "core/config.hpp"
#include "io/moderation/base_moderation_client.hpp"

#include <cstdint>
#include <string>

// Discord REST v10 client. Timeouts become communication_disabled_until on
// the guild member, deletions and warnings go through the channel routes.
class HttpModerationClient : public IModerationClient {
public:
  explicit HttpModerationClient(const Config::ActionExecutorConfig &config);

  ApiResult mute(uint64_t guild_id, uint64_t user_id,
                 uint64_t duration_seconds,
                 const std::string &reason) override;
  ApiResult delete_message(uint64_t guild_id, uint64_t channel_id,
                           uint64_t message_id,
                           const std::string &reason) override;
  ApiResult warn(uint64_t guild_id, uint64_t channel_id, uint64_t user_id,
                 const std::string &reason) override;

  const char *get_name() const override { return "HttpModerationClient"; }

  bool is_valid() const { return !host_.empty(); }

private:
  enum class Method { PATCH, DELETE, POST };

  ApiResult send(Method method, const std::string &route,
                 const std::string &body, const std::string &reason);

  std::string host_;
  std::string base_path_;
  bool is_https_ = true;
  std::string bot_token_;
  uint32_t timeout_ms_;
};

// ISO 8601 UTC timestamp, e.g. 2024-01-01T06:00:00.000Z
std::string format_iso8601_utc(uint64_t epoch_ms);

// Percent-encodes characters outside the unreserved set
std::string url_encode(const std::string &value);

#endif // HTTP_MODERATION_CLIENT_HPP
