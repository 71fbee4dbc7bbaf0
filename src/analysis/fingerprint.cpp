#include "fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

// Length in bytes of an invisible UTF-8 sequence at text[i], or 0
size_t invisible_sequence_length(std::string_view text, size_t i) {
  auto byte = [&](size_t k) {
    return static_cast<unsigned char>(text[i + k]);
  };
  if (i + 2 >= text.size())
    return 0;
  // U+200B..U+200D zero width space / joiners, U+2060 word joiner
  if (byte(0) == 0xE2 && byte(1) == 0x80 && byte(2) >= 0x8B && byte(2) <= 0x8D)
    return 3;
  if (byte(0) == 0xE2 && byte(1) == 0x81 && byte(2) == 0xA0)
    return 3;
  // U+FEFF byte order mark
  if (byte(0) == 0xEF && byte(1) == 0xBB && byte(2) == 0xBF)
    return 3;
  return 0;
}

bool is_utf8_continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool starts_with_ci(std::string_view text, size_t pos, std::string_view prefix) {
  if (text.size() - pos < prefix.size())
    return false;
  for (size_t i = 0; i < prefix.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(text[pos + i])) != prefix[i])
      return false;
  return true;
}

// Length of a <@id>, <@!id>, <@&id> or <#id> mention at pos, or 0. The
// id-less token is written to `token`.
size_t mention_length(std::string_view text, size_t pos, std::string &token) {
  if (text[pos] != '<' || pos + 1 >= text.size())
    return 0;
  size_t i = pos + 1;
  if (text[i] == '#') {
    token = "<#>";
    ++i;
  } else if (text[i] == '@') {
    ++i;
    token = "<@>";
    if (i < text.size() && text[i] == '&') {
      token = "<@&>";
      ++i;
    } else if (i < text.size() && text[i] == '!') {
      ++i;
    }
  } else {
    return 0;
  }

  size_t digits_start = i;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])))
    ++i;
  if (i == digits_start || i >= text.size() || text[i] != '>')
    return 0;
  return i + 1 - pos;
}

} // namespace

std::string canonicalize_tokens(std::string_view content) {
  std::string out;
  out.reserve(content.size());
  std::string token;

  for (size_t i = 0; i < content.size();) {
    if (size_t length = mention_length(content, i, token)) {
      out += token;
      i += length;
      continue;
    }

    bool token_start =
        i == 0 || std::isspace(static_cast<unsigned char>(content[i - 1]));
    size_t scheme = 0;
    if (token_start && starts_with_ci(content, i, "https://"))
      scheme = 8;
    else if (token_start && starts_with_ci(content, i, "http://"))
      scheme = 7;
    if (scheme == 0) {
      out.push_back(content[i++]);
      continue;
    }

    i += scheme;
    if (starts_with_ci(content, i, "www."))
      i += 4;
    size_t end = i;
    while (end < content.size() &&
           !std::isspace(static_cast<unsigned char>(content[end])))
      ++end;
    std::string_view url = content.substr(i, end - i);
    if (!url.empty() && url.back() == '/')
      url.remove_suffix(1);
    out.append(url.data(), url.size());
    i = end;
  }
  return out;
}

std::string normalize_content(std::string_view raw_content, size_t max_length) {
  const std::string canonical = canonicalize_tokens(raw_content);
  const std::string_view content = canonical;
  std::string normalized;
  normalized.reserve(std::min(content.size(), max_length));

  bool pending_space = false;
  for (size_t i = 0; i < content.size();) {
    size_t invisible = invisible_sequence_length(content, i);
    if (invisible > 0) {
      i += invisible;
      continue;
    }

    unsigned char c = static_cast<unsigned char>(content[i++]);
    if (std::isspace(c)) {
      pending_space = !normalized.empty();
      continue;
    }
    if (c < 0x20 || c == 0x7F)
      continue;

    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    normalized.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
  }

  if (normalized.size() > max_length) {
    size_t cut = max_length;
    while (cut > 0 && is_utf8_continuation(normalized[cut]))
      --cut;
    normalized.resize(cut);
    while (!normalized.empty() && normalized.back() == ' ')
      normalized.pop_back();
  }
  return normalized;
}

uint64_t fnv1a_hash(std::string_view text) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (char c : text) {
    hash ^= static_cast<unsigned char>(c);
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

Fingerprint Fingerprint::from_message(std::string_view content,
                                      uint32_t attachment_count,
                                      uint32_t sticker_count,
                                      size_t max_length) {
  Fingerprint fp;
  fp.normalized = normalize_content(content, max_length);
  if (attachment_count > 0)
    fp.normalized += (fp.normalized.empty() ? "" : " ") +
                     std::string("<attachment:") +
                     std::to_string(attachment_count) + ">";
  if (sticker_count > 0)
    fp.normalized += (fp.normalized.empty() ? "" : " ") +
                     std::string("<sticker:") + std::to_string(sticker_count) +
                     ">";
  fp.hash = fnv1a_hash(fp.normalized);
  return fp;
}

size_t levenshtein_distance(std::string_view a, std::string_view b) {
  if (a.size() < b.size())
    std::swap(a, b);
  if (b.empty())
    return a.size();

  std::vector<size_t> previous(b.size() + 1);
  std::vector<size_t> current(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j)
    previous[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

double similarity_ratio(std::string_view a, std::string_view b) {
  size_t longest = std::max(a.size(), b.size());
  if (longest == 0)
    return 1.0;
  return 1.0 - static_cast<double>(levenshtein_distance(a, b)) /
                   static_cast<double>(longest);
}

double max_possible_similarity(size_t len_a, size_t len_b) {
  size_t longest = std::max(len_a, len_b);
  if (longest == 0)
    return 1.0;
  return static_cast<double>(std::min(len_a, len_b)) /
         static_cast<double>(longest);
}

double fingerprint_similarity(const Fingerprint &a, const Fingerprint &b,
                              double min_similarity) {
  if (a.hash == b.hash && a.normalized == b.normalized)
    return 1.0;
  if (max_possible_similarity(a.normalized.size(), b.normalized.size()) <
      min_similarity)
    return 0.0;
  return similarity_ratio(a.normalized, b.normalized);
}
