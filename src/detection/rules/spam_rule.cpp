#include "spam_rule.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

namespace {

constexpr double KEYWORD_POINTS = 0.15;
constexpr double HEAVY_CAPS_POINTS = 0.25;   // over half the letters
constexpr double MODERATE_CAPS_POINTS = 0.15; // over 30% of the letters
constexpr double MANY_EXCLAMATIONS_POINTS = 0.3;
constexpr double SOME_EXCLAMATIONS_POINTS = 0.15;
constexpr double EMOJI_FLOOD_POINTS = 0.25;
constexpr double REPEATED_CHARACTER_POINTS = 0.2;
constexpr double FULLWIDTH_POINTS = 0.3;
constexpr double LINK_FLOOD_POINTS = 0.2;
constexpr double INVITE_FLOOD_POINTS = 0.25;

// Money and fire emoji, UTF-8 encoded
const std::vector<std::string> &money_emoji() {
  static const std::vector<std::string> emoji = {
      "\xF0\x9F\x92\xB0", "\xF0\x9F\x94\xA5", "\xF0\x9F\x92\x8E",
      "\xF0\x9F\x92\xB8"};
  return emoji;
}

const std::vector<std::string> &fullwidth_spam_words() {
  static const std::vector<std::string> words = {
      "\xEF\xBC\xA6\xEF\xBC\xB2", // FR
      "\xEF\xBC\xAD\xEF\xBC\xAF\xEF\xBC\xAE\xEF\xBC\xA5\xEF\xBC\xB9", // MONEY
      "\xEF\xBC\xA3\xEF\xBC\xAC\xEF\xBC\xA9\xEF\xBC\xA3\xEF\xBC\xAB", // CLICK
      "\xEF\xBC\xA7\xEF\xBC\xA9\xEF\xBC\xB6\xEF\xBC\xA5\xEF\xBC\xA1\xEF\xBC\xB7"
      "\xEF\xBC\xA1\xEF\xBC\xB9"}; // GIVEAWAY
  return words;
}

const char *const BITCOIN_STREAK = "\xE2\x82\xBF\xE2\x82\xBF\xE2\x82\xBF";

size_t emoji_at(const std::string &text, size_t pos) {
  const auto &emoji = money_emoji();
  for (size_t i = 0; i < emoji.size(); ++i)
    if (text.compare(pos, emoji[i].size(), emoji[i]) == 0)
      return i + 1;
  return 0;
}

// Three of the same money emoji in a row, three bitcoin signs in a row, or
// at least three pairs of money emoji anywhere in the text
bool has_emoji_flood(const std::string &text) {
  size_t pairs = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    if (text.compare(pos, 9, BITCOIN_STREAK) == 0)
      return true;

    size_t first = emoji_at(text, pos);
    if (first == 0) {
      ++pos;
      continue;
    }

    size_t run = 0;
    size_t same = 0;
    size_t previous = 0;
    while (pos < text.size()) {
      size_t current = emoji_at(text, pos);
      if (current == 0)
        break;
      same = current == previous ? same + 1 : 1;
      // Only the money bag and fire count as a same-emoji streak
      if (same >= 3 && current <= 2)
        return true;
      previous = current;
      ++run;
      pos += 4;
    }
    pairs += run / 2;
    if (pairs >= 3)
      return true;
  }
  return false;
}

bool has_repeated_character(const std::string &text) {
  size_t run = 1;
  for (size_t i = 1; i < text.size(); ++i) {
    run = text[i] == text[i - 1] ? run + 1 : 1;
    if (run >= 5)
      return true;
  }
  return false;
}

size_t count_occurrences(const std::string &text, const std::string &needle) {
  size_t count = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size()))
    ++count;
  return count;
}

// discord.gg/ followed by at least one word character
size_t count_invites(const std::string &lowercase_text) {
  static const std::string prefix = "discord.gg/";
  size_t count = 0;
  for (size_t pos = lowercase_text.find(prefix); pos != std::string::npos;
       pos = lowercase_text.find(prefix, pos + prefix.size())) {
    size_t next = pos + prefix.size();
    if (next < lowercase_text.size()) {
      unsigned char c = static_cast<unsigned char>(lowercase_text[next]);
      if (std::isalnum(c) || c == '_')
        ++count;
    }
  }
  return count;
}

std::string format_points(double points) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << points;
  return out.str();
}

} // namespace

SpamScore score_content(const std::string &content,
                        const Utils::AhoCorasick &keyword_matcher,
                        size_t max_scan_bytes) {
  const std::string text = content.size() > max_scan_bytes
                               ? content.substr(0, max_scan_bytes)
                               : content;
  const std::string lowered = Utils::to_lower_copy(text);
  SpamScore result;
  auto add = [&result](double points, const std::string &reason) {
    result.score += points;
    result.reasons.push_back(reason + " +" + format_points(points));
  };

  std::set<std::string> keywords;
  for (auto &keyword : keyword_matcher.find_all(lowered))
    keywords.insert(std::move(keyword));
  for (const auto &keyword : keywords)
    add(KEYWORD_POINTS, "keyword '" + keyword + "'");

  size_t letters = 0;
  size_t uppercase = 0;
  for (char c : text) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      ++letters;
      if (std::isupper(uc))
        ++uppercase;
    }
  }
  if (letters > 0) {
    double ratio = static_cast<double>(uppercase) / static_cast<double>(letters);
    if (ratio > 0.5)
      add(HEAVY_CAPS_POINTS, "mostly capitals");
    else if (ratio > 0.3)
      add(MODERATE_CAPS_POINTS, "many capitals");
  }

  const size_t exclamations = std::count(text.begin(), text.end(), '!');
  if (exclamations > 5)
    add(MANY_EXCLAMATIONS_POINTS, std::to_string(exclamations) + " '!'");
  else if (exclamations > 3)
    add(SOME_EXCLAMATIONS_POINTS, std::to_string(exclamations) + " '!'");

  if (has_emoji_flood(text))
    add(EMOJI_FLOOD_POINTS, "emoji flood");
  if (has_repeated_character(text))
    add(REPEATED_CHARACTER_POINTS, "repeated character");

  for (const auto &word : fullwidth_spam_words()) {
    if (text.find(word) != std::string::npos) {
      add(FULLWIDTH_POINTS, "fullwidth text");
      break;
    }
  }

  const size_t links = count_occurrences(lowered, "http://") +
                       count_occurrences(lowered, "https://");
  if (links > 3)
    add(LINK_FLOOD_POINTS, std::to_string(links) + " links");
  const size_t invites = count_invites(lowered);
  if (invites > 2)
    add(INVITE_FLOOD_POINTS, std::to_string(invites) + " invites");

  result.score = std::min(result.score, 1.0);
  return result;
}

std::shared_ptr<const Utils::AhoCorasick>
ContentSpamRule::keyword_matcher_for(const Config::RulesConfig &rules) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  if (cached_matcher_ && cached_keywords_ == rules.scam_keywords)
    return cached_matcher_;

  std::vector<std::string> lowered;
  lowered.reserve(rules.scam_keywords.size());
  for (const auto &keyword : rules.scam_keywords)
    lowered.push_back(Utils::to_lower_copy(keyword));
  cached_keywords_ = rules.scam_keywords;
  cached_matcher_ = std::make_shared<const Utils::AhoCorasick>(lowered);
  return cached_matcher_;
}

std::optional<RuleSignal>
ContentSpamRule::evaluate(const RuleContext &context) {
  const auto &rules = context.config.rules;
  auto matcher = keyword_matcher_for(rules);
  SpamScore spam = score_content(context.window.subject->content, *matcher,
                                 rules.max_scan_bytes);
  if (spam.score < rules.spam_min_score)
    return std::nullopt;

  RuleSignal signal;
  signal.rule = RuleId::CONTENT_SPAM;
  signal.confidence = spam.score;
  std::ostringstream evidence;
  evidence << "content score " << format_points(spam.score) << " (";
  for (size_t i = 0; i < spam.reasons.size(); ++i)
    evidence << (i > 0 ? ", " : "") << spam.reasons[i];
  evidence << ")";
  signal.evidence = evidence.str();
  signal.evidence_message_ids.push_back(context.window.subject->message_id);

  LOG(LogLevel::DEBUG, LogComponent::RULES_SPAM,
      "Content spam rule fired for " << context.window.key.to_string() << ": "
                                     << signal.evidence);
  return signal;
}
