#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

std::vector<std::string> parse_list(std::string_view value) {
  std::vector<std::string> items;
  for (std::string_view part : split_string_view(value, ',')) {
    std::string item = trim_copy(part);
    if (!item.empty())
      items.push_back(std::move(item));
  }
  return items;
}

std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::optional<std::string> get_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0')
    return std::nullopt;
  return std::string(value);
}

} // namespace Utils
