#ifndef DECISION_ENGINE_HPP
#define DECISION_ENGINE_HPP

#include "analysis/window_store.hpp"
#include "core/config.hpp"
#include "core/decision.hpp"
#include "detection/offense_store.hpp"
#include "detection/rule_evaluator.hpp"
#include "detection/rules/account_risk.hpp"

#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

// Aggregates rule signals into a Decision and computes escalated mute
// durations from the offense store.
//
// evaluate() reads the offense store but never writes it, so calling it twice
// for the same snapshot, config and offense state yields equivalent decisions.
// commit() records a mute decision. Callers must serialize evaluate/commit
// for the same (guild, user) key; decide() does both in one call.
class DecisionEngine {
public:
  explicit DecisionEngine(OffenseStore &offense_store);
  DecisionEngine(OffenseStore &offense_store,
                 std::vector<std::unique_ptr<IRuleEvaluator>> evaluators);

  // Rate, duplicate content and suspicious link, in that order
  static std::vector<std::unique_ptr<IRuleEvaluator>> default_evaluators();

  Decision evaluate(const WindowSnapshot &snapshot,
                    const Config::AppConfig &config);
  void commit(const Decision &decision, uint64_t event_time_ms);
  Decision decide(const WindowSnapshot &snapshot,
                  const Config::AppConfig &config);

  // Mute length for the nth mute inside the escalation window (n >= 1)
  static uint64_t escalated_duration(uint64_t base_seconds, uint32_t offense_number,
                                     const Config::EscalationConfig &escalation);

private:
  std::vector<RuleSignal> run_evaluators(const RuleContext &context,
                                         const Config::RulesConfig &rules,
                                         double &weighted_sum);
  void apply_escalation(Decision &decision, const Config::AppConfig &config,
                        const Config::GuildSettings &settings,
                        uint64_t event_time_ms) const;
  void report_config_gap(uint64_t guild_id);

  OffenseStore &offense_store_;
  std::vector<std::unique_ptr<IRuleEvaluator>> evaluators_;
  NewAccountRiskAssessor account_risk_;

  std::mutex gap_mutex_;
  std::unordered_set<uint64_t> reported_gaps_;
};

#endif // DECISION_ENGINE_HPP
