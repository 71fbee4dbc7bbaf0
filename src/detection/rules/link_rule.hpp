#ifndef LINK_RULE_HPP
#define LINK_RULE_HPP

#include "detection/rule_evaluator.hpp"
#include "utils/aho_corasick.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct ExtractedLink {
  std::string url;    // as matched, lowercased
  std::string domain; // host part without a leading "www."
};

// Finds http(s) URLs and bare domain.tld tokens in lowercased text
std::vector<ExtractedLink> extract_links(const std::string &lowercase_text);

// True when domain equals an allowlisted domain or is a subdomain of one
bool is_allowlisted_domain(const std::string &domain,
                           const std::vector<std::string> &allowlist);

// Fires on a denylisted domain or suspicious TLD with the denylist
// confidence, otherwise on a mass mention combined with a non-allowlisted
// link and a scam keyword with the scam confidence.
class LinkRule : public IRuleEvaluator {
public:
  RuleId rule_id() const override { return RuleId::SUSPICIOUS_LINK; }
  bool is_enabled(const Config::GuildSettings &settings) const override {
    return settings.link_enabled;
  }
  double weight(const Config::RulesConfig &rules) const override {
    return rules.link_weight;
  }

  std::optional<RuleSignal> evaluate(const RuleContext &context) override;

private:
  struct Matchers {
    std::vector<std::string> denylist;
    std::vector<std::string> keywords;
    std::shared_ptr<const Utils::AhoCorasick> denylist_matcher;
    std::shared_ptr<const Utils::AhoCorasick> keyword_matcher;
  };

  // Rebuilt only when the configured lists change
  std::shared_ptr<const Matchers> matchers_for(const Config::RulesConfig &rules);

  std::mutex cache_mutex_;
  std::shared_ptr<const Matchers> cached_;
};

#endif // LINK_RULE_HPP
