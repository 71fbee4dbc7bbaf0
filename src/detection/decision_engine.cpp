#include "decision_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "rules/duplicate_rule.hpp"
#include "rules/link_rule.hpp"
#include "rules/rate_rule.hpp"
#include "rules/spam_rule.hpp"
#include "rules/scoring.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>

DecisionEngine::DecisionEngine(OffenseStore &offense_store)
    : DecisionEngine(offense_store, default_evaluators()) {}

DecisionEngine::DecisionEngine(
    OffenseStore &offense_store,
    std::vector<std::unique_ptr<IRuleEvaluator>> evaluators)
    : offense_store_(offense_store), evaluators_(std::move(evaluators)) {
  LOG(LogLevel::INFO, LogComponent::DECISION,
      "DecisionEngine created with " << evaluators_.size()
                                     << " rule evaluators.");
}

std::vector<std::unique_ptr<IRuleEvaluator>>
DecisionEngine::default_evaluators() {
  std::vector<std::unique_ptr<IRuleEvaluator>> evaluators;
  evaluators.push_back(std::make_unique<RateRule>());
  evaluators.push_back(std::make_unique<DuplicateRule>());
  evaluators.push_back(std::make_unique<LinkRule>());
  evaluators.push_back(std::make_unique<ContentSpamRule>());
  return evaluators;
}

uint64_t DecisionEngine::escalated_duration(
    uint64_t base_seconds, uint32_t offense_number,
    const Config::EscalationConfig &escalation) {
  const double cap = static_cast<double>(escalation.max_mute_seconds);
  double duration = static_cast<double>(base_seconds);
  for (uint32_t i = 1; i < offense_number && duration < cap; ++i)
    duration *= escalation.escalation_factor;
  return static_cast<uint64_t>(std::min(duration, cap));
}

void DecisionEngine::report_config_gap(uint64_t guild_id) {
  static LabeledCounter *config_gaps =
      MetricsManager::instance().register_labeled_counter(
          "gw_config_gaps_total",
          "Evaluations for guilds without configuration, run at medium "
          "sensitivity.");
  config_gaps->increment();

  std::lock_guard<std::mutex> lock(gap_mutex_);
  if (reported_gaps_.insert(guild_id).second)
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "No configuration for guild " << guild_id
                                      << ", falling back to medium "
                                         "sensitivity.");
}

std::vector<RuleSignal>
DecisionEngine::run_evaluators(const RuleContext &context,
                               const Config::RulesConfig &rules,
                               double &weighted_sum) {
  static LabeledCounter *rule_errors =
      MetricsManager::instance().register_labeled_counter(
          "gw_rule_errors_total",
          "Rule evaluations that failed and were treated as no signal.");
  static LabeledCounter *rule_hits =
      MetricsManager::instance().register_labeled_counter(
          "gw_rule_signals_total", "Signals produced per rule.");

  std::vector<RuleSignal> signals;
  weighted_sum = 0.0;

  for (auto &evaluator : evaluators_) {
    if (!evaluator->is_enabled(context.settings))
      continue;

    const char *rule_name = rule_id_to_string(evaluator->rule_id());
    std::optional<RuleSignal> signal;
    try {
      signal = evaluator->evaluate(context);
    } catch (const PartitionFault &) {
      throw;
    } catch (const std::exception &e) {
      rule_errors->increment({{"rule", rule_name}});
      LOG(LogLevel::WARN, LogComponent::RULES_EVAL,
          "Rule " << rule_name << " failed for "
                  << context.window.key.to_string() << ": " << e.what());
      continue;
    }

    if (!signal)
      continue;
    signal->rule = evaluator->rule_id();
    signal->confidence = Scoring::clamp_confidence(signal->confidence);
    if (signal->confidence <= 0.0)
      continue;

    rule_hits->increment({{"rule", rule_name}});
    weighted_sum +=
        Scoring::weighted(signal->confidence, evaluator->weight(rules));
    signals.push_back(std::move(*signal));
  }
  return signals;
}

void DecisionEngine::apply_escalation(Decision &decision,
                                      const Config::AppConfig &config,
                                      const Config::GuildSettings &settings,
                                      uint64_t event_time_ms) const {
  const uint64_t window_ms =
      config.escalation.escalation_window_seconds * 1000;

  uint32_t offense_number = 1;
  std::optional<OffenseRecord> prior =
      offense_store_.get({decision.guild_id, decision.user_id});
  if (prior && prior->mute_count > 0) {
    // Events can arrive out of order; distance counts either way
    const uint64_t gap = event_time_ms >= prior->last_mute_ms
                             ? event_time_ms - prior->last_mute_ms
                             : prior->last_mute_ms - event_time_ms;
    if (gap <= window_ms)
      offense_number = prior->mute_count + 1;
  }

  decision.offense_count = offense_number;
  decision.duration_seconds = escalated_duration(
      settings.base_mute_seconds, offense_number, config.escalation);
  decision.stage = DecisionStage::ESCALATED;

  if (offense_number > 1)
    LOG(LogLevel::INFO, LogComponent::ESCALATION,
        "Escalating mute for user " << decision.user_id << " in guild "
                                    << decision.guild_id << ": offense #"
                                    << offense_number << ", "
                                    << decision.duration_seconds << "s");
}

Decision DecisionEngine::evaluate(const WindowSnapshot &snapshot,
                                  const Config::AppConfig &config) {
  static Histogram *evaluation_timer =
      MetricsManager::instance().register_histogram(
          "gw_evaluation_duration_seconds",
          "Latency of evaluating all rules and deciding on one message.");
  ScopedTimer timer(*evaluation_timer);

  const MessageEvent &event = *snapshot.subject;
  Config::GuildSettings settings =
      Config::resolve_guild_settings(config, event.guild_id);
  if (!settings.configured)
    report_config_gap(event.guild_id);

  Decision decision;
  decision.guild_id = event.guild_id;
  decision.channel_id = event.channel_id;
  decision.user_id = event.author_id;
  decision.message_id = event.message_id;
  decision.sensitivity = settings.sensitivity;
  decision.decided_at_ms = Utils::get_current_time_ms();

  RuleContext context{snapshot, config, settings};
  double weighted_sum = 0.0;
  decision.signals = run_evaluators(context, config.rules, weighted_sum);
  decision.stage = DecisionStage::EVALUATED;

  for (const auto &signal : decision.signals)
    decision.triggering_rules.push_back(signal.rule);

  if (!decision.signals.empty() && settings.account_risk_enabled) {
    if (auto risk = account_risk_.assess(event, config.rules)) {
      decision.risk_multiplier = risk->multiplier;
      decision.triggering_rules.push_back(RuleId::NEW_ACCOUNT_RISK);
    }
  }

  decision.combined_confidence =
      Scoring::clamp_confidence(weighted_sum * decision.risk_multiplier);

  const auto &profile = settings.profile;
  if (decision.signals.empty())
    decision.action = ActionType::NONE;
  else if (decision.combined_confidence >= profile.mute_threshold)
    decision.action = ActionType::MUTE;
  else if (decision.combined_confidence >= profile.warn_threshold)
    decision.action = ActionType::WARN;
  decision.stage = DecisionStage::DECIDED;

  if (decision.action == ActionType::MUTE)
    apply_escalation(decision, config, settings, event.received_at_ms);

  LOG(LogLevel::DEBUG, LogComponent::DECISION,
      "Message " << decision.message_id << " from user " << decision.user_id
                 << " in guild " << decision.guild_id << ": "
                 << action_type_to_string(decision.action) << " (confidence "
                 << decision.combined_confidence << ", "
                 << decision.signals.size() << " signals)");
  return decision;
}

void DecisionEngine::commit(const Decision &decision, uint64_t event_time_ms) {
  static LabeledCounter *decisions =
      MetricsManager::instance().register_labeled_counter(
          "gw_decisions_total", "Decisions made, by action.");
  decisions->increment({{"action", action_type_to_string(decision.action)}});

  if (decision.action != ActionType::MUTE)
    return;

  OffenseRecord record;
  record.mute_count = decision.offense_count;
  record.last_mute_ms = event_time_ms;
  record.last_duration_seconds = decision.duration_seconds;
  offense_store_.commit_mute({decision.guild_id, decision.user_id}, record);
}

Decision DecisionEngine::decide(const WindowSnapshot &snapshot,
                                const Config::AppConfig &config) {
  Decision decision = evaluate(snapshot, config);
  commit(decision, snapshot.subject->received_at_ms);
  return decision;
}
