#include "link_rule.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace {

std::vector<std::string> lowercase_all(const std::vector<std::string> &items) {
  std::vector<std::string> out;
  out.reserve(items.size());
  for (const auto &item : items)
    out.push_back(Utils::to_lower_copy(item));
  return out;
}

bool ends_with(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool has_suspicious_tld(const std::string &domain,
                        const std::vector<std::string> &tlds) {
  for (const auto &tld : tlds) {
    if (tld.empty())
      continue;
    std::string suffix = tld.front() == '.' ? tld : "." + tld;
    if (ends_with(domain, Utils::to_lower_copy(suffix)))
      return true;
  }
  return false;
}

bool is_alnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

struct HostScan {
  size_t end = 0;    // one past the top-level domain, 0 when nothing matched
  size_t resume = 0; // where the next attempt may start after a miss

  bool matched() const { return end != 0; }
};

// Dot-separated labels ending in an alphabetic top-level domain of 2-63
// letters. Takes the longest such host starting at `start`. Every position
// is visited a bounded number of times, so hostile input stays linear.
HostScan scan_host(const std::string &text, size_t start) {
  const size_t n = text.size();
  HostScan scan;
  size_t label_start = start;
  bool have_label = false;

  while (true) {
    if (have_label) {
      size_t letters = 0;
      while (label_start + letters < n && letters < 63 &&
             text[label_start + letters] >= 'a' &&
             text[label_start + letters] <= 'z')
        ++letters;
      if (letters >= 2)
        scan.end = label_start + letters;
    }

    size_t label_end = label_start;
    while (label_end < n && (is_alnum(text[label_end]) || text[label_end] == '-'))
      ++label_end;

    bool valid_label = label_end > label_start && is_alnum(text[label_start]) &&
                       is_alnum(text[label_end - 1]);
    if (!valid_label || label_end >= n || text[label_end] != '.') {
      scan.resume = label_start > start ? label_start : label_end;
      return scan;
    }
    have_label = true;
    label_start = label_end + 1;
  }
}

} // namespace

std::vector<ExtractedLink> extract_links(const std::string &lowercase_text) {
  const std::string &text = lowercase_text;
  const size_t n = text.size();
  std::vector<ExtractedLink> links;

  size_t pos = 0;
  while (pos < n) {
    if (!is_alnum(text[pos])) {
      ++pos;
      continue;
    }

    size_t host_start = pos;
    if (text.compare(pos, 8, "https://") == 0)
      host_start = pos + 8;
    else if (text.compare(pos, 7, "http://") == 0)
      host_start = pos + 7;

    HostScan host = scan_host(text, host_start);
    if (!host.matched() && host_start != pos) {
      host_start = pos;
      host = scan_host(text, host_start);
    }
    if (!host.matched()) {
      pos = std::max(pos + 1, host.resume);
      continue;
    }

    size_t end = host.end;
    if (end + 1 < n && text[end] == ':' && is_digit(text[end + 1])) {
      size_t port_end = end + 1;
      while (port_end < n && port_end - end <= 5 && is_digit(text[port_end]))
        ++port_end;
      end = port_end;
    }
    if (end < n && (text[end] == '/' || text[end] == '?' || text[end] == '#')) {
      while (end < n && !is_space(text[end]))
        ++end;
    }

    // Skip the domain part of an e-mail address or a mention like @user.name
    if (pos == 0 || text[pos - 1] != '@') {
      ExtractedLink link;
      link.url = text.substr(pos, end - pos);
      link.domain = text.substr(host_start, host.end - host_start);
      if (link.domain.rfind("www.", 0) == 0)
        link.domain.erase(0, 4);
      links.push_back(std::move(link));
    }
    pos = end;
  }
  return links;
}

bool is_allowlisted_domain(const std::string &domain,
                           const std::vector<std::string> &allowlist) {
  for (const auto &allowed_raw : allowlist) {
    std::string allowed = Utils::to_lower_copy(allowed_raw);
    if (allowed.empty())
      continue;
    if (domain == allowed || ends_with(domain, "." + allowed))
      return true;
  }
  return false;
}

std::shared_ptr<const LinkRule::Matchers>
LinkRule::matchers_for(const Config::RulesConfig &rules) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  if (cached_ && cached_->denylist == rules.denylist_domains &&
      cached_->keywords == rules.scam_keywords)
    return cached_;

  auto matchers = std::make_shared<Matchers>();
  matchers->denylist = rules.denylist_domains;
  matchers->keywords = rules.scam_keywords;
  matchers->denylist_matcher = std::make_shared<const Utils::AhoCorasick>(
      lowercase_all(rules.denylist_domains));
  matchers->keyword_matcher = std::make_shared<const Utils::AhoCorasick>(
      lowercase_all(rules.scam_keywords));
  cached_ = matchers;

  LOG(LogLevel::DEBUG, LogComponent::RULES_LINK,
      "Rebuilt link matchers with " << rules.denylist_domains.size()
                                    << " denylist patterns and "
                                    << rules.scam_keywords.size()
                                    << " scam keywords");
  return cached_;
}

std::optional<RuleSignal> LinkRule::evaluate(const RuleContext &context) {
  const auto &rules = context.config.rules;
  const std::string &content = context.window.subject->content;
  const std::string text = Utils::to_lower_copy(
      content.size() > rules.max_scan_bytes
          ? content.substr(0, rules.max_scan_bytes)
          : content);

  std::vector<ExtractedLink> links = extract_links(text);
  if (links.empty())
    return std::nullopt;

  auto matchers = matchers_for(rules);
  const uint64_t message_id = context.window.subject->message_id;

  for (const auto &link : links) {
    std::optional<std::string> pattern =
        matchers->denylist_matcher->find_first(link.url);
    bool bad_tld = !pattern && has_suspicious_tld(link.domain,
                                                  rules.suspicious_tlds);
    if (!pattern && !bad_tld)
      continue;

    RuleSignal signal;
    signal.rule = RuleId::SUSPICIOUS_LINK;
    signal.confidence = rules.denylist_confidence;
    signal.evidence = pattern ? "denylisted domain " + link.domain +
                                    " (pattern " + *pattern + ")"
                              : "suspicious top-level domain " + link.domain;
    signal.evidence_message_ids.push_back(message_id);
    LOG(LogLevel::DEBUG, LogComponent::RULES_LINK,
        "Link rule fired for " << context.window.key.to_string() << ": "
                               << signal.evidence);
    return signal;
  }

  auto mention = std::find_if(
      rules.mass_mention_tokens.begin(), rules.mass_mention_tokens.end(),
      [&text](const std::string &token) {
        return !token.empty() &&
               text.find(Utils::to_lower_copy(token)) != std::string::npos;
      });
  if (mention == rules.mass_mention_tokens.end())
    return std::nullopt;

  auto unknown_link = std::find_if(
      links.begin(), links.end(), [&rules](const ExtractedLink &link) {
        return !is_allowlisted_domain(link.domain, rules.allowlist_domains);
      });
  if (unknown_link == links.end())
    return std::nullopt;

  std::optional<std::string> keyword =
      matchers->keyword_matcher->find_first(text);
  if (!keyword)
    return std::nullopt;

  RuleSignal signal;
  signal.rule = RuleId::SUSPICIOUS_LINK;
  signal.confidence = rules.scam_confidence;
  signal.evidence = *mention + " with link " + unknown_link->domain +
                    " and scam keyword '" + *keyword + "'";
  signal.evidence_message_ids.push_back(message_id);

  LOG(LogLevel::DEBUG, LogComponent::RULES_LINK,
      "Link rule fired for " << context.window.key.to_string() << ": "
                             << signal.evidence);
  return signal;
}
