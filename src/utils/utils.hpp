#ifndef UTILS_HPP
#define UTILS_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
// Splits on every delimiter and keeps empty fields
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);
uint64_t get_current_time_ms();

// Creates the parent directory of a file path if it does not exist yet
bool create_directory_for_file(const std::string &file_path);

// Splits a comma separated list, trims each item and drops empty ones
std::vector<std::string> parse_list(std::string_view value);

std::string to_lower_copy(std::string_view sv);

// Reads an environment variable, empty optional when unset or empty
std::optional<std::string> get_env(const char *name);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline std::string trim_copy(std::string_view sv) {
  constexpr std::string_view whitespace = " \t\r\n\f\v";
  size_t first = sv.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  size_t last = sv.find_last_not_of(whitespace);
  return std::string(sv.substr(first, last - first + 1));
}

// Mixes a second hash into the first (boost::hash_combine constant)
inline uint64_t hash_combine(uint64_t seed, uint64_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}
} // namespace Utils

#endif // UTILS_HPP
