#ifndef DUPLICATE_RULE_HPP
#define DUPLICATE_RULE_HPP

#include "detection/rule_evaluator.hpp"

// Compares the subject message with up to duplicate_lookback preceding
// messages. The rule counts the run of consecutive near-duplicates ending at
// the subject; it fires once that run (subject included) reaches the
// sensitivity's minimum. The most similar pair in the run is reported, the
// most recent one on a tie.
class DuplicateRule : public IRuleEvaluator {
public:
  RuleId rule_id() const override { return RuleId::DUPLICATE; }
  bool is_enabled(const Config::GuildSettings &settings) const override {
    return settings.duplicate_enabled;
  }
  double weight(const Config::RulesConfig &rules) const override {
    return rules.duplicate_weight;
  }

  std::optional<RuleSignal> evaluate(const RuleContext &context) override;
};

#endif // DUPLICATE_RULE_HPP
