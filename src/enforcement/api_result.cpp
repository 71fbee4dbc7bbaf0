#include "api_result.hpp"
#include "utils/utils.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {

// Hints are clamped to a year so the millisecond count always fits
constexpr double MAX_RETRY_AFTER_SECONDS = 365.0 * 24 * 60 * 60;

std::optional<std::chrono::milliseconds> seconds_to_delay(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0)
    return std::nullopt;
  seconds = std::min(seconds, MAX_RETRY_AFTER_SECONDS);
  return std::chrono::milliseconds(
      static_cast<long long>(std::ceil(seconds * 1000.0)));
}

} // namespace

const char *api_result_kind_to_string(ApiResultKind kind) {
  switch (kind) {
  case ApiResultKind::SUCCESS:
    return "success";
  case ApiResultKind::RETRYABLE:
    return "retryable";
  case ApiResultKind::NON_RETRYABLE:
    return "non_retryable";
  }
  return "unknown";
}

ApiResult ApiResult::success(int status) {
  ApiResult result;
  result.kind = ApiResultKind::SUCCESS;
  result.status = status;
  return result;
}

ApiResult
ApiResult::retryable(std::string error, int status,
                     std::optional<std::chrono::milliseconds> retry_after) {
  ApiResult result;
  result.kind = ApiResultKind::RETRYABLE;
  result.status = status;
  result.retry_after = retry_after;
  result.error = std::move(error);
  return result;
}

ApiResult ApiResult::non_retryable(std::string error, int status) {
  ApiResult result;
  result.kind = ApiResultKind::NON_RETRYABLE;
  result.status = status;
  result.error = std::move(error);
  return result;
}

std::optional<std::chrono::milliseconds>
parse_retry_after_seconds(const std::string &text) {
  std::string trimmed = Utils::trim_copy(text);
  if (trimmed.empty())
    return std::nullopt;

  char *end = nullptr;
  double seconds = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size())
    return std::nullopt;
  return seconds_to_delay(seconds);
}

namespace {

std::optional<std::chrono::milliseconds>
retry_after_from_body(const std::string &body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object())
    return std::nullopt;
  auto it = json.find("retry_after");
  if (it == json.end() || !it->is_number())
    return std::nullopt;
  return seconds_to_delay(it->get<double>());
}

std::string error_from_body(int status, const std::string &body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (!json.is_discarded() && json.is_object()) {
    auto it = json.find("message");
    if (it != json.end() && it->is_string())
      return "HTTP " + std::to_string(status) + ": " + it->get<std::string>();
  }
  return "HTTP " + std::to_string(status);
}

} // namespace

ApiResult classify_http_response(int status, const std::string &body,
                                 const std::string &retry_after_header) {
  if (status >= 200 && status < 300)
    return ApiResult::success(status);

  if (status == 429) {
    auto hint = parse_retry_after_seconds(retry_after_header);
    if (!hint)
      hint = retry_after_from_body(body);
    return ApiResult::retryable("rate limited", status, hint);
  }

  if (status == 408 || status >= 500)
    return ApiResult::retryable(error_from_body(status, body), status);

  return ApiResult::non_retryable(error_from_body(status, body), status);
}

ApiResult classify_transport_error(const std::string &error) {
  return ApiResult::retryable("transport error: " + error);
}
