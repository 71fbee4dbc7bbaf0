#include "http_moderation_client.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/utils.hpp"

#include "nlohmann/json.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <regex>
#include <type_traits>

std::string format_iso8601_utc(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                static_cast<int>(epoch_ms % 1000));
  return buffer;
}

std::string url_encode(const std::string &value) {
  static const char *hex = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(hex[c >> 4]);
      encoded.push_back(hex[c & 0x0F]);
    }
  }
  return encoded;
}

HttpModerationClient::HttpModerationClient(
    const Config::ActionExecutorConfig &config)
    : bot_token_(config.bot_token), timeout_ms_(config.request_timeout_ms) {
  // Group 1: protocol, group 2: host[:port], group 3: base path
  std::regex url_regex(R"(^(https?):\/\/([^\/]+)(\/.*)?$)");
  std::smatch match;

  if (std::regex_match(config.api_base_url, match, url_regex)) {
    is_https_ = match[1].str() == "https";
    host_ = match[2].str();
    base_path_ = match[3].matched ? match[3].str() : "";
    if (!base_path_.empty() && base_path_.back() == '/')
      base_path_.pop_back();
    LOG(LogLevel::INFO, LogComponent::IO_API,
        "HttpModerationClient targeting " << (is_https_ ? "https://" : "http://")
                                          << host_ << base_path_);
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_API,
        "Invalid moderation API base URL: " << config.api_base_url);
  }

  if (bot_token_.empty())
    LOG(LogLevel::WARN, LogComponent::IO_API,
        "No bot token configured; moderation calls will be rejected.");
}

ApiResult HttpModerationClient::send(Method method, const std::string &route,
                                     const std::string &body,
                                     const std::string &reason) {
  if (host_.empty())
    return ApiResult::non_retryable("invalid API base URL", 0);

  const std::string path = base_path_ + route;
  httplib::Headers headers = {{"Authorization", "Bot " + bot_token_},
                              {"User-Agent", "guild_warden (1.0)"}};
  if (!reason.empty())
    headers.emplace("X-Audit-Log-Reason", url_encode(reason.substr(0, 512)));

  ApiResult result;
  auto send_request = [&](auto &client) {
    if constexpr (std::is_same_v<std::decay_t<decltype(client)>,
                                 httplib::SSLClient>) {
      client.enable_server_certificate_verification(true);
    }
    const time_t seconds = timeout_ms_ / 1000;
    const time_t microseconds = (timeout_ms_ % 1000) * 1000;
    client.set_connection_timeout(seconds, microseconds);
    client.set_read_timeout(seconds, microseconds);
    client.set_write_timeout(seconds, microseconds);

    auto res = [&]() {
      switch (method) {
      case Method::PATCH:
        return client.Patch(path, headers, body, "application/json");
      case Method::DELETE:
        return client.Delete(path, headers);
      case Method::POST:
        break;
      }
      return client.Post(path, headers, body, "application/json");
    }();

    if (!res) {
      result = classify_transport_error(httplib::to_string(res.error()));
      return;
    }
    result = classify_http_response(res->status, res->body,
                                    res->get_header_value("Retry-After"));
  };

  if (is_https_) {
    httplib::SSLClient cli(host_);
    send_request(cli);
  } else {
    httplib::Client cli(host_);
    send_request(cli);
  }

  if (result.is_success())
    LOG(LogLevel::TRACE, LogComponent::IO_API,
        "Request to " << path << " succeeded | Status: " << result.status);
  else
    LOG(LogLevel::DEBUG, LogComponent::IO_API,
        "Request to " << path << " failed ("
                      << api_result_kind_to_string(result.kind)
                      << ") | Status: " << result.status << " | "
                      << result.error);
  return result;
}

ApiResult HttpModerationClient::mute(uint64_t guild_id, uint64_t user_id,
                                     uint64_t duration_seconds,
                                     const std::string &reason) {
  uint64_t until_ms = Utils::get_current_time_ms() + duration_seconds * 1000;
  nlohmann::json body = {
      {"communication_disabled_until", format_iso8601_utc(until_ms)}};
  return send(Method::PATCH,
              "/guilds/" + std::to_string(guild_id) + "/members/" +
                  std::to_string(user_id),
              body.dump(), reason);
}

ApiResult HttpModerationClient::delete_message(uint64_t /*guild_id*/,
                                               uint64_t channel_id,
                                               uint64_t message_id,
                                               const std::string &reason) {
  return send(Method::DELETE,
              "/channels/" + std::to_string(channel_id) + "/messages/" +
                  std::to_string(message_id),
              "", reason);
}

ApiResult HttpModerationClient::warn(uint64_t /*guild_id*/,
                                     uint64_t channel_id, uint64_t user_id,
                                     const std::string &reason) {
  nlohmann::json body = {
      {"content", "<@" + std::to_string(user_id) + "> " + reason},
      {"allowed_mentions", {{"users", {std::to_string(user_id)}}}}};
  return send(Method::POST,
              "/channels/" + std::to_string(channel_id) + "/messages",
              body.dump(), "");
}
