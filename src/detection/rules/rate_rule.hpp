#ifndef RATE_RULE_HPP
#define RATE_RULE_HPP

#include "detection/rule_evaluator.hpp"

// Fires when the author sent at least the sensitivity's rate threshold of
// messages in the trailing rate sub-window ending at the subject message
class RateRule : public IRuleEvaluator {
public:
  RuleId rule_id() const override { return RuleId::RATE; }
  bool is_enabled(const Config::GuildSettings &settings) const override {
    return settings.rate_enabled;
  }
  double weight(const Config::RulesConfig &rules) const override {
    return rules.rate_weight;
  }

  std::optional<RuleSignal> evaluate(const RuleContext &context) override;
};

#endif // RATE_RULE_HPP
