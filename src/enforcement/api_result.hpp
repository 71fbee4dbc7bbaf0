#ifndef API_RESULT_HPP
#define API_RESULT_HPP

#include <chrono>
#include <optional>
#include <string>

enum class ApiResultKind { SUCCESS, RETRYABLE, NON_RETRYABLE };

const char *api_result_kind_to_string(ApiResultKind kind);

// Outcome of one attempt against the moderation API. Retryability is data,
// not an exception, so the retry loop can branch on it.
struct ApiResult {
  ApiResultKind kind = ApiResultKind::SUCCESS;
  int status = 0; // 0 when no HTTP response was received
  std::optional<std::chrono::milliseconds> retry_after;
  std::string error;

  bool is_success() const { return kind == ApiResultKind::SUCCESS; }
  bool is_retryable() const { return kind == ApiResultKind::RETRYABLE; }

  static ApiResult success(int status = 200);
  static ApiResult retryable(std::string error, int status = 0,
                             std::optional<std::chrono::milliseconds>
                                 retry_after = std::nullopt);
  static ApiResult non_retryable(std::string error, int status);
};

// 2xx success; 429 retryable with the Retry-After header or the JSON
// retry_after field (seconds) as hint; 408 and 5xx retryable; any other
// status non-retryable
ApiResult classify_http_response(int status, const std::string &body,
                                 const std::string &retry_after_header);

// Connection refused, timeouts and other failures with no response
ApiResult classify_transport_error(const std::string &error);

// Parses a delay given in (possibly fractional) seconds. Values beyond a
// year are clamped to a year.
std::optional<std::chrono::milliseconds>
parse_retry_after_seconds(const std::string &text);

#endif // API_RESULT_HPP
