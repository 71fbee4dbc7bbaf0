#ifndef RULE_EVALUATOR_HPP
#define RULE_EVALUATOR_HPP

#include "analysis/window_store.hpp"
#include "core/config.hpp"
#include "core/decision.hpp"

#include <optional>

// Everything a rule may look at for one message. The snapshot and config are
// immutable for the duration of the evaluation.
struct RuleContext {
  const WindowSnapshot &window;
  const Config::AppConfig &config;
  const Config::GuildSettings &settings;
};

// A rule that may fire on one message. Implementations keep no per-message
// state; a read-through cache keyed by configuration is allowed.
class IRuleEvaluator {
public:
  virtual ~IRuleEvaluator() = default;

  virtual RuleId rule_id() const = 0;
  virtual bool is_enabled(const Config::GuildSettings &settings) const = 0;
  virtual double weight(const Config::RulesConfig &rules) const = 0;

  virtual std::optional<RuleSignal> evaluate(const RuleContext &context) = 0;
};

#endif // RULE_EVALUATOR_HPP
