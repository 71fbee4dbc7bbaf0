#include "detection/decision_engine.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

constexpr uint64_t BASE_TS = 1700000000000ULL;
constexpr uint64_t DAY_MS = 24ULL * 60 * 60 * 1000;
constexpr uint64_t GUILD = 100;

class ThrowingRule : public IRuleEvaluator {
public:
  RuleId rule_id() const override { return RuleId::RATE; }
  bool is_enabled(const Config::GuildSettings &) const override { return true; }
  double weight(const Config::RulesConfig &) const override { return 1.0; }
  std::optional<RuleSignal> evaluate(const RuleContext &) override {
    throw std::runtime_error("boom");
  }
};

class DecisionEngineTest : public ::testing::Test {
protected:
  void configure_guild(Config::SensitivityLevel level) {
    Config::GuildConfig guild;
    guild.sensitivity = level;
    config_.guilds[GUILD] = guild;
  }

  MessageEvent make_event(uint64_t message_id, uint64_t ts,
                          const std::string &content, uint64_t user = 7) {
    MessageEvent event;
    event.message_id = message_id;
    event.guild_id = GUILD;
    event.channel_id = 55;
    event.author_id = user;
    event.content = content;
    event.received_at_ms = ts;
    return event;
  }

  Decision send(const MessageEvent &event) {
    return engine_.decide(store_.record(event), config_);
  }

  Config::AppConfig config_;
  WindowStore store_{600000, 50, 4};
  OffenseStore offenses_{4};
  DecisionEngine engine_{offenses_};
};

} // namespace

TEST_F(DecisionEngineTest, ScamLinkFromNewAccountIsMuted) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  MessageEvent event =
      make_event(1, BASE_TS, "@everyone buy cheap nitro discord.gift/xyz");
  event.account_created_at_ms = BASE_TS - 2 * DAY_MS;

  Decision decision = send(event);
  EXPECT_EQ(decision.action, ActionType::MUTE);
  ASSERT_EQ(decision.triggering_rules.size(), 2u);
  EXPECT_EQ(decision.triggering_rules[0], RuleId::SUSPICIOUS_LINK);
  EXPECT_EQ(decision.triggering_rules[1], RuleId::NEW_ACCOUNT_RISK);
  EXPECT_DOUBLE_EQ(decision.risk_multiplier, 1.5);
  EXPECT_DOUBLE_EQ(decision.combined_confidence, 1.0);
  EXPECT_EQ(decision.duration_seconds, config_.escalation.base_mute_seconds);
  EXPECT_EQ(decision.offense_count, 1u);
  EXPECT_EQ(decision.stage, DecisionStage::ESCALATED);
}

TEST_F(DecisionEngineTest, ScamLinkFromEstablishedAccountIsWarned) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  MessageEvent event =
      make_event(1, BASE_TS, "@everyone buy cheap nitro discord.gift/xyz");
  event.account_created_at_ms = BASE_TS - 365 * DAY_MS;

  Decision decision = send(event);
  EXPECT_EQ(decision.action, ActionType::WARN);
  EXPECT_DOUBLE_EQ(decision.combined_confidence, 0.7);
  EXPECT_EQ(decision.stage, DecisionStage::DECIDED);
  EXPECT_EQ(decision.duration_seconds, 0u);
  EXPECT_EQ(offenses_.size(), 0u);
}

TEST_F(DecisionEngineTest, RepeatedMessagesAtLowSensitivityAreMuted) {
  configure_guild(Config::SensitivityLevel::LOW);
  std::vector<Decision> decisions;
  for (uint64_t i = 0; i < 6; ++i)
    decisions.push_back(
        send(make_event(i + 1, BASE_TS + i * 1500, "join my server now")));

  // Two identical messages are not yet a run of three
  EXPECT_EQ(decisions[0].action, ActionType::NONE);
  EXPECT_EQ(decisions[1].action, ActionType::NONE);
  EXPECT_EQ(decisions[2].action, ActionType::MUTE);
  EXPECT_TRUE(decisions[2].has_rule(RuleId::DUPLICATE));
  EXPECT_FALSE(decisions[2].has_rule(RuleId::RATE));

  const Decision &last = decisions.back();
  EXPECT_EQ(last.action, ActionType::MUTE);
  EXPECT_TRUE(last.has_rule(RuleId::DUPLICATE));
  EXPECT_FALSE(last.has_rule(RuleId::RATE)) << "6 messages is below 8 per 10s";
}

TEST_F(DecisionEngineTest, BurstAtHighSensitivityIsMuted) {
  configure_guild(Config::SensitivityLevel::HIGH);
  send(make_event(1, BASE_TS, "good morning everyone"));
  send(make_event(2, BASE_TS + 1000, "12345"));
  Decision decision = send(make_event(3, BASE_TS + 2000, "xyz?"));

  EXPECT_EQ(decision.action, ActionType::MUTE);
  ASSERT_EQ(decision.triggering_rules.size(), 1u);
  EXPECT_EQ(decision.triggering_rules[0], RuleId::RATE);
  EXPECT_DOUBLE_EQ(decision.combined_confidence, 0.8);
}

TEST_F(DecisionEngineTest, SameBurstAtMediumSensitivityIsIgnored) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  send(make_event(1, BASE_TS, "good morning everyone"));
  send(make_event(2, BASE_TS + 1000, "12345"));
  Decision decision = send(make_event(3, BASE_TS + 2000, "xyz?"));
  EXPECT_EQ(decision.action, ActionType::NONE);
  EXPECT_TRUE(decision.triggering_rules.empty());
  EXPECT_EQ(decision.stage, DecisionStage::DECIDED);
}

TEST_F(DecisionEngineTest, EscalationDoublesWithinWindow) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  const std::string spam = "@everyone free nitro at dlscord.gift/claim";

  Decision first = send(make_event(1, BASE_TS, spam));
  Decision second = send(make_event(2, BASE_TS + 60000, spam));
  Decision third = send(make_event(3, BASE_TS + 120000, spam));

  EXPECT_EQ(first.offense_count, 1u);
  EXPECT_EQ(first.duration_seconds, 21600u);
  EXPECT_EQ(second.offense_count, 2u);
  EXPECT_EQ(second.duration_seconds, 43200u);
  EXPECT_EQ(third.offense_count, 3u);
  EXPECT_EQ(third.duration_seconds, 86400u);

  auto record = offenses_.get({GUILD, 7});
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->mute_count, 3u);
  EXPECT_EQ(record->last_mute_ms, BASE_TS + 120000);
}

TEST_F(DecisionEngineTest, ShoutedScamIsMutedByContentScore) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  Decision decision =
      send(make_event(1, BASE_TS, "FREE NITRO GIVEAWAY!!!!!! CLICK NOW"));
  EXPECT_EQ(decision.action, ActionType::MUTE);
  EXPECT_TRUE(decision.has_rule(RuleId::CONTENT_SPAM));
  EXPECT_FALSE(decision.has_rule(RuleId::SUSPICIOUS_LINK));

  config_.guilds[GUILD].spam_enabled = false;
  Decision disabled =
      send(make_event(2, BASE_TS + 60000, "FREE NITRO GIVEAWAY!!!!!! CLICK NOW"));
  EXPECT_FALSE(disabled.has_rule(RuleId::CONTENT_SPAM));
}

TEST_F(DecisionEngineTest, LateMuteStillEscalates) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  const std::string spam = "@everyone free nitro at dlscord.gift/claim";

  send(make_event(1, BASE_TS, spam));
  send(make_event(2, BASE_TS + 60000, spam));
  Decision late = send(make_event(3, BASE_TS + 30000, spam));
  EXPECT_EQ(late.action, ActionType::MUTE);
  EXPECT_EQ(late.offense_count, 3u);
  EXPECT_EQ(late.duration_seconds, 86400u);

  // The late mute must not rewind the escalation window
  auto record = offenses_.get({GUILD, 7});
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->mute_count, 3u);
  EXPECT_EQ(record->last_mute_ms, BASE_TS + 60000);

  Decision next = send(make_event(4, BASE_TS + 90000, spam));
  EXPECT_EQ(next.offense_count, 4u);
  EXPECT_EQ(next.duration_seconds, 172800u);
}

TEST(OffenseStoreTest, OlderRecordDoesNotReplaceNewer) {
  OffenseStore store(2);
  const GuildUserKey key{GUILD, 9};
  store.commit_mute(key, OffenseRecord{2, BASE_TS + 5000, 43200});
  store.commit_mute(key, OffenseRecord{3, BASE_TS, 86400});

  auto record = store.get(key);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->mute_count, 3u);
  EXPECT_EQ(record->last_mute_ms, BASE_TS + 5000);
  EXPECT_EQ(record->last_duration_seconds, 86400u);

  store.commit_mute(key, OffenseRecord{1, BASE_TS + 9000, 21600});
  EXPECT_EQ(store.get(key)->mute_count, 1u);
  EXPECT_EQ(store.get(key)->last_mute_ms, BASE_TS + 9000);
}

TEST_F(DecisionEngineTest, EscalationResetsAfterWindow) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  const std::string spam = "dlscord.gift/claim";
  send(make_event(1, BASE_TS, spam));

  const uint64_t later =
      BASE_TS + config_.escalation.escalation_window_seconds * 1000 + 1;
  Decision decision = send(make_event(2, later, spam));
  EXPECT_EQ(decision.offense_count, 1u);
  EXPECT_EQ(decision.duration_seconds, 21600u);
}

TEST_F(DecisionEngineTest, GuildMuteDurationOverridesBase) {
  Config::GuildConfig guild;
  guild.mute_duration_seconds = 600;
  config_.guilds[GUILD] = guild;
  Decision decision = send(make_event(1, BASE_TS, "dlscord.gift/claim"));
  EXPECT_EQ(decision.duration_seconds, 600u);
}

TEST(EscalatedDurationTest, DoublesUpToCap) {
  Config::EscalationConfig escalation;
  EXPECT_EQ(DecisionEngine::escalated_duration(21600, 1, escalation), 21600u);
  EXPECT_EQ(DecisionEngine::escalated_duration(21600, 2, escalation), 43200u);
  EXPECT_EQ(DecisionEngine::escalated_duration(21600, 4, escalation), 172800u);
  EXPECT_EQ(DecisionEngine::escalated_duration(21600, 5, escalation), 345600u);
  EXPECT_EQ(DecisionEngine::escalated_duration(21600, 6, escalation), 604800u);
  EXPECT_EQ(DecisionEngine::escalated_duration(21600, 40, escalation), 604800u);
  EXPECT_EQ(DecisionEngine::escalated_duration(999999, 1, escalation), 604800u);
}

TEST_F(DecisionEngineTest, EvaluateIsIdempotent) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  send(make_event(1, BASE_TS, "dlscord.gift/claim"));

  WindowSnapshot snapshot =
      store_.record(make_event(2, BASE_TS + 1000, "dlscord.gift/claim"));
  Decision a = engine_.evaluate(snapshot, config_);
  Decision b = engine_.evaluate(snapshot, config_);
  EXPECT_TRUE(a.equivalent_to(b));
  EXPECT_EQ(a.offense_count, 2u);
  EXPECT_EQ(offenses_.get({GUILD, 7})->mute_count, 1u);
}

TEST_F(DecisionEngineTest, DecisionTimeIsNotPartOfEquivalence) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  WindowSnapshot snapshot =
      store_.record(make_event(1, BASE_TS, "dlscord.gift/claim"));
  Decision a = engine_.evaluate(snapshot, config_);
  Decision b = a;
  b.decided_at_ms = a.decided_at_ms + 5000;
  EXPECT_GT(a.decided_at_ms, 0u);
  EXPECT_TRUE(a.equivalent_to(b));

  b.offense_count += 1;
  EXPECT_FALSE(a.equivalent_to(b));
}

TEST_F(DecisionEngineTest, UnconfiguredGuildUsesMediumSensitivity) {
  Decision decision = send(make_event(1, BASE_TS, "hello"));
  EXPECT_EQ(decision.sensitivity, Config::SensitivityLevel::MEDIUM);
  EXPECT_EQ(decision.action, ActionType::NONE);

  Config::GuildSettings settings = Config::resolve_guild_settings(config_, 999);
  EXPECT_FALSE(settings.configured);
  EXPECT_EQ(settings.profile.rate_threshold, 5u);
}

TEST_F(DecisionEngineTest, DisabledRulesDoNotFire) {
  Config::GuildConfig guild;
  guild.link_enabled = false;
  config_.guilds[GUILD] = guild;
  Decision decision = send(make_event(1, BASE_TS, "dlscord.gift/claim"));
  EXPECT_EQ(decision.action, ActionType::NONE);
}

TEST_F(DecisionEngineTest, RuleWeightScalesConfidence) {
  configure_guild(Config::SensitivityLevel::MEDIUM);
  config_.rules.link_weight = 0.5;
  Decision decision = send(make_event(1, BASE_TS, "dlscord.gift/claim"));
  EXPECT_DOUBLE_EQ(decision.combined_confidence, 0.5);
  EXPECT_EQ(decision.action, ActionType::WARN);
}

TEST(DecisionEngineErrorsTest, FailingRuleIsTreatedAsNoSignal) {
  OffenseStore offenses(1);
  std::vector<std::unique_ptr<IRuleEvaluator>> evaluators;
  evaluators.push_back(std::make_unique<ThrowingRule>());
  DecisionEngine engine(offenses, std::move(evaluators));

  WindowStore store(600000, 50, 1);
  MessageEvent event;
  event.message_id = 1;
  event.guild_id = GUILD;
  event.author_id = 2;
  event.received_at_ms = BASE_TS;

  Config::AppConfig config;
  Decision decision;
  ASSERT_NO_THROW(decision = engine.decide(store.record(event), config));
  EXPECT_EQ(decision.action, ActionType::NONE);
  EXPECT_TRUE(decision.signals.empty());
}
