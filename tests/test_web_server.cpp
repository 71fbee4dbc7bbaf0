#include "io/web/web_server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace {

class NullAuditStore : public IAuditStore {
public:
  bool append(const AuditLogEntry &) override { return true; }
  std::vector<AuditLogEntry> load_recent(size_t) override { return {}; }
  const char *get_name() const override { return "NullAuditStore"; }
};

// Tests may run as parallel processes, so each gets its own port
int port_for_current_test() {
  std::string name =
      ::testing::UnitTest::GetInstance()->current_test_info()->name();
  return 18000 + static_cast<int>(std::hash<std::string>{}(name) % 1000);
}

} // namespace

TEST(GuildConfigFromJsonTest, ReadsKnownFields) {
  std::string error;
  auto guild = guild_config_from_json(
      nlohmann::json::parse(R"({"sensitivity":"HIGH","mute_duration_seconds":600,
                               "link_enabled":false,"warn_threshold":0.2})"),
      error);
  ASSERT_TRUE(guild.has_value()) << error;
  EXPECT_EQ(guild->sensitivity, Config::SensitivityLevel::HIGH);
  EXPECT_EQ(guild->mute_duration_seconds, std::optional<uint64_t>(600));
  EXPECT_EQ(guild->link_enabled, std::optional<bool>(false));
  EXPECT_FALSE(guild->rate_enabled.has_value());
  EXPECT_EQ(guild->warn_threshold, std::optional<double>(0.2));
}

TEST(GuildConfigFromJsonTest, RejectsBadInput) {
  std::string error;
  EXPECT_FALSE(
      guild_config_from_json(nlohmann::json::array(), error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(guild_config_from_json(
                   nlohmann::json::parse(R"({"sensitivity":"extreme"})"), error)
                   .has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(guild_config_from_json(
                   nlohmann::json::parse(R"({"rate_enabled":"maybe"})"), error)
                   .has_value());
  EXPECT_FALSE(error.empty());
}

class WebServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    audit_logger_ = std::make_shared<AuditLogger>(
        std::make_unique<NullAuditStore>(), Config::AuditConfig{});
    pipeline_ = std::make_unique<ModerationPipeline>(config_manager_, nullptr,
                                                     audit_logger_);
    const int port = port_for_current_test();
    server_ = std::make_unique<WebServer>(
        "127.0.0.1", port, MetricsRegistry::instance(), *audit_logger_,
        *pipeline_, config_manager_);
    server_->start();

    client_ = std::make_unique<httplib::Client>("127.0.0.1", port);
    for (int i = 0; i < 100; ++i) {
      if (client_->Get("/health"))
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }

  void TearDown() override {
    server_->stop();
    pipeline_->stop();
  }

  Config::ConfigManager config_manager_;
  std::shared_ptr<AuditLogger> audit_logger_;
  std::unique_ptr<ModerationPipeline> pipeline_;
  std::unique_ptr<WebServer> server_;
  std::unique_ptr<httplib::Client> client_;
};

TEST_F(WebServerTest, AdminEndpoints) {
  auto health = client_->Get("/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 200);
  auto health_json = nlohmann::json::parse(health->body);
  EXPECT_TRUE(health_json.contains("pipeline"));
  EXPECT_EQ(health_json["pipeline"]["processed"], 0);

  auto missing_guild = client_->Get("/api/v1/audit");
  ASSERT_TRUE(missing_guild);
  EXPECT_EQ(missing_guild->status, 400);

  auto manual = client_->Post(
      "/api/v1/audit/manual",
      R"({"guild_id":"555","user_id":"7","moderator_id":"9","action":"mute",
          "duration_seconds":60,"reason":"spam"})",
      "application/json");
  ASSERT_TRUE(manual);
  EXPECT_EQ(manual->status, 201);

  auto audit = client_->Get("/api/v1/audit?guild_id=555&action=mute");
  ASSERT_TRUE(audit);
  EXPECT_EQ(audit->status, 200);
  auto entries = nlohmann::json::parse(audit->body);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["moderator_id"], "9");
  EXPECT_EQ(entries[0]["reason"], "spam");

  auto bad_action = client_->Get("/api/v1/audit?guild_id=555&action=ban");
  ASSERT_TRUE(bad_action);
  EXPECT_EQ(bad_action->status, 400);

  auto metrics = client_->Get("/metrics");
  ASSERT_TRUE(metrics);
  EXPECT_EQ(metrics->status, 200);
  EXPECT_NE(metrics->body.find("gw_audit_entries_total"), std::string::npos);
}

TEST_F(WebServerTest, GuildConfigUpdate) {
  auto ok = client_->Put("/api/v1/guilds/321/config",
                         R"({"sensitivity":"low","mute_duration_seconds":900})",
                         "application/json");
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->status, 204);

  auto settings =
      Config::resolve_guild_settings(*config_manager_.get_config(), 321);
  EXPECT_TRUE(settings.configured);
  EXPECT_EQ(settings.sensitivity, Config::SensitivityLevel::LOW);
  EXPECT_EQ(settings.base_mute_seconds, 900u);

  auto rejected = client_->Put("/api/v1/guilds/321/config",
                               R"({"mute_duration_seconds":0})",
                               "application/json");
  ASSERT_TRUE(rejected);
  EXPECT_EQ(rejected->status, 422);

  auto malformed =
      client_->Put("/api/v1/guilds/321/config", "{", "application/json");
  ASSERT_TRUE(malformed);
  EXPECT_EQ(malformed->status, 400);
}
