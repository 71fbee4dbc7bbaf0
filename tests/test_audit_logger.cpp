#include "core/audit_logger.hpp"
#include "io/audit/file_audit_store.hpp"
#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Keeps nothing; every append fails
class FailingAuditStore : public IAuditStore {
public:
  bool append(const AuditLogEntry &) override { return false; }
  std::vector<AuditLogEntry> load_recent(size_t) override { return {}; }
  const char *get_name() const override { return "FailingAuditStore"; }
};

class AuditLoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("gw_audit_test_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    path_ = (dir_ / "audit.jsonl").string();
  }

  void TearDown() override { fs::remove_all(dir_); }

  std::unique_ptr<AuditLogger> make_logger() {
    auto logger = std::make_unique<AuditLogger>(
        std::make_unique<FileAuditStore>(path_), config_);
    logger->initialize();
    return logger;
  }

  static Decision make_decision(uint64_t user_id, ActionType action,
                                uint64_t decided_at_ms) {
    Decision decision;
    decision.guild_id = 500;
    decision.channel_id = 20;
    decision.user_id = user_id;
    decision.message_id = decided_at_ms;
    decision.action = action;
    decision.combined_confidence = 0.8;
    decision.triggering_rules = {RuleId::RATE};
    decision.duration_seconds = action == ActionType::MUTE ? 21600 : 0;
    decision.decided_at_ms = decided_at_ms;
    if (action != ActionType::NONE) {
      ActionOutcome outcome;
      outcome.success = true;
      outcome.total_attempts = 1;
      outcome.completed_at_ms = decided_at_ms + 5;
      outcome.calls.push_back({action == ActionType::MUTE ? ApiCallKind::MUTE
                                                           : ApiCallKind::WARN,
                               true, 1, 200, ""});
      decision.outcome = outcome;
    }
    return decision;
  }

  size_t line_count() const {
    std::ifstream in(path_);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line))
      ++lines;
    return lines;
  }

  fs::path dir_;
  std::string path_;
  Config::AuditConfig config_;
};

} // namespace

TEST_F(AuditLoggerTest, RecordsDecisionAndWritesOneLine) {
  auto logger = make_logger();
  auto entry = logger->record_decision(make_decision(7, ActionType::MUTE, 1000));

  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->id, 1u);
  EXPECT_EQ(entry->action, ActionType::MUTE);
  EXPECT_EQ(entry->timestamp_ms, 1005u);
  EXPECT_GE(entry->timestamp_ms, entry->decided_at_ms);
  EXPECT_TRUE(entry->success);
  EXPECT_FALSE(entry->moderator_id.has_value());
  EXPECT_EQ(line_count(), 1u);

  auto results = logger->query(500, {}, 10);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].user_id, 7u);
  EXPECT_EQ(results[0].duration_seconds, 21600u);
}

TEST_F(AuditLoggerTest, NoneDecisionsSkippedUnlessEnabled) {
  auto logger = make_logger();
  EXPECT_FALSE(logger->record_decision(make_decision(7, ActionType::NONE, 1000))
                   .has_value());
  EXPECT_EQ(logger->entry_count(500), 0u);
  EXPECT_EQ(line_count(), 0u);

  config_.log_none_decisions = true;
  logger->reconfigure(config_);
  auto entry = logger->record_decision(make_decision(7, ActionType::NONE, 1000));
  ASSERT_TRUE(entry.has_value());
  EXPECT_TRUE(entry->success);
  EXPECT_EQ(logger->entry_count(500), 1u);
}

TEST_F(AuditLoggerTest, QueryReturnsNewestFirstAndAppliesFilters) {
  auto logger = make_logger();
  logger->record_decision(make_decision(1, ActionType::WARN, 1000));
  logger->record_decision(make_decision(2, ActionType::MUTE, 2000));
  logger->record_decision(make_decision(1, ActionType::MUTE, 3000));

  auto all = logger->query(500, {}, 10);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].decided_at_ms, 3000u);
  EXPECT_EQ(all[2].decided_at_ms, 1000u);

  AuditQueryFilter by_user;
  by_user.user_id = 1;
  EXPECT_EQ(logger->query(500, by_user, 10).size(), 2u);

  AuditQueryFilter by_action;
  by_action.action = ActionType::MUTE;
  auto mutes = logger->query(500, by_action, 10);
  ASSERT_EQ(mutes.size(), 2u);
  EXPECT_EQ(mutes[0].user_id, 1u);
  EXPECT_EQ(mutes[1].user_id, 2u);

  AuditQueryFilter since;
  since.since_ms = 2000;
  EXPECT_EQ(logger->query(500, since, 10).size(), 2u);

  EXPECT_EQ(logger->query(500, {}, 1).size(), 1u);
  EXPECT_TRUE(logger->query(999, {}, 10).empty());
}

TEST_F(AuditLoggerTest, ManualActionCarriesModerator) {
  auto logger = make_logger();
  AuditLogEntry entry = logger->record_manual_action(
      500, 42, 9001, ActionType::MUTE, 3600, "manual review");

  ASSERT_TRUE(entry.moderator_id.has_value());
  EXPECT_EQ(*entry.moderator_id, 9001u);
  EXPECT_DOUBLE_EQ(entry.confidence, 1.0);
  EXPECT_TRUE(entry.success);
  EXPECT_TRUE(entry.triggering_rules.empty());

  auto results = logger->query(500, {}, 10);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].reason, "manual review");
}

TEST_F(AuditLoggerTest, TrimsOldestEntriesPerGuild) {
  config_.max_entries_per_guild = 2;
  auto logger = make_logger();
  for (uint64_t t = 1; t <= 4; ++t)
    logger->record_decision(make_decision(t, ActionType::WARN, t * 1000));

  EXPECT_EQ(logger->entry_count(500), 2u);
  auto results = logger->query(500, {}, 10);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].user_id, 4u);
  EXPECT_EQ(results[1].user_id, 3u);
  // The durable file keeps everything
  EXPECT_EQ(line_count(), 4u);
}

TEST_F(AuditLoggerTest, ReloadRestoresIndexAndContinuesIds) {
  {
    auto logger = make_logger();
    logger->record_decision(make_decision(1, ActionType::WARN, 1000));
    logger->record_decision(make_decision(2, ActionType::MUTE, 2000));
  }
  {
    std::ofstream out(path_, std::ios::app);
    out << "not json at all" << std::endl;
    out << std::endl;
  }

  auto reloaded = std::make_unique<AuditLogger>(
      std::make_unique<FileAuditStore>(path_), config_);
  EXPECT_EQ(reloaded->initialize(), 2u);
  EXPECT_EQ(reloaded->entry_count(500), 2u);

  auto next = reloaded->record_decision(make_decision(3, ActionType::WARN, 3000));
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->id, 3u);

  auto results = reloaded->query(500, {}, 10);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[1].user_id, 2u);
  ASSERT_EQ(results[1].calls.size(), 1u);
  EXPECT_EQ(results[1].calls[0].kind, ApiCallKind::MUTE);
  EXPECT_EQ(results[1].calls[0].last_status, 200);
}

TEST_F(AuditLoggerTest, FailedWritesStayQueryable) {
  AuditLogger logger(std::make_unique<FailingAuditStore>(), config_);
  logger.initialize();
  auto entry = logger.record_decision(make_decision(7, ActionType::WARN, 1000));
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(logger.entry_count(500), 1u);
}

TEST(AuditEntryTest, FailedOutcomeKeepsErrorAndIdsSerializeAsStrings) {
  Decision decision;
  decision.guild_id = 123456789012345678ULL;
  decision.user_id = 876543210987654321ULL;
  decision.action = ActionType::MUTE;
  decision.decided_at_ms = 5000;
  ActionOutcome outcome;
  outcome.success = false;
  outcome.total_attempts = 3;
  outcome.completed_at_ms = 4000; // clock skew; never earlier than decided
  outcome.error = "mute: HTTP 502";
  decision.outcome = outcome;

  AuditLogEntry entry = AuditLogEntry::from_decision(decision);
  EXPECT_FALSE(entry.success);
  EXPECT_EQ(entry.timestamp_ms, 5000u);
  EXPECT_EQ(entry.error, "mute: HTTP 502");

  auto json = JsonFormatter::audit_entry_to_json_object(entry);
  EXPECT_EQ(json["guild_id"].get<std::string>(), "123456789012345678");
  EXPECT_TRUE(json["moderator_id"].is_null());

  auto parsed = JsonFormatter::audit_entry_from_json(json);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->user_id, 876543210987654321ULL);
  EXPECT_EQ(parsed->total_attempts, 3u);
}
