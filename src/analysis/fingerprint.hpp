#ifndef FINGERPRINT_HPP
#define FINGERPRINT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Normalized representation of a message body used for near-duplicate
// detection. Two messages that differ only in case, spacing, invisible
// characters, mentioned ids or URL spelling share a fingerprint.
struct Fingerprint {
  std::string normalized;
  uint64_t hash = 0;

  static Fingerprint from_message(std::string_view content,
                                  uint32_t attachment_count,
                                  uint32_t sticker_count, size_t max_length);
};

// Rewrites user, role and channel mentions to id-less tokens (<@>, <@&>,
// <#>) and drops the scheme, a leading "www." and a trailing '/' from
// http(s) URLs
std::string canonicalize_tokens(std::string_view content);

// Canonicalizes tokens, lowercases ASCII, drops control and zero-width
// characters, collapses runs of whitespace and truncates to max_length bytes
// on a UTF-8 boundary
std::string normalize_content(std::string_view content, size_t max_length);

uint64_t fnv1a_hash(std::string_view text);

size_t levenshtein_distance(std::string_view a, std::string_view b);

// 1 - distance / max(len_a, len_b); two empty strings are identical
double similarity_ratio(std::string_view a, std::string_view b);

// Upper bound of similarity_ratio given only the lengths
double max_possible_similarity(size_t len_a, size_t len_b);

// Similarity with an exact-match shortcut on the hash and a length prune:
// returns 0.0 without computing the distance when the lengths alone cannot
// reach min_similarity
double fingerprint_similarity(const Fingerprint &a, const Fingerprint &b,
                              double min_similarity = 0.0);

#endif // FINGERPRINT_HPP
