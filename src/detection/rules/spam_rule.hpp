#ifndef SPAM_RULE_HPP
#define SPAM_RULE_HPP

#include "detection/rule_evaluator.hpp"
#include "utils/aho_corasick.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Heuristic score of a single message's content
struct SpamScore {
  double score = 0.0; // capped at 1.0
  std::vector<std::string> reasons;
};

// Scores at most max_scan_bytes of content. Keyword matching expects the
// matcher to hold lowercased keywords.
SpamScore score_content(const std::string &content,
                        const Utils::AhoCorasick &keyword_matcher,
                        size_t max_scan_bytes);

// Fires when the content score reaches spam_min_score; the score becomes
// the signal's confidence
class ContentSpamRule : public IRuleEvaluator {
public:
  RuleId rule_id() const override { return RuleId::CONTENT_SPAM; }
  bool is_enabled(const Config::GuildSettings &settings) const override {
    return settings.spam_enabled;
  }
  double weight(const Config::RulesConfig &rules) const override {
    return rules.spam_weight;
  }

  std::optional<RuleSignal> evaluate(const RuleContext &context) override;

private:
  std::shared_ptr<const Utils::AhoCorasick>
  keyword_matcher_for(const Config::RulesConfig &rules);

  std::mutex cache_mutex_;
  std::vector<std::string> cached_keywords_;
  std::shared_ptr<const Utils::AhoCorasick> cached_matcher_;
};

#endif // SPAM_RULE_HPP
