#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <unistd.h>

#include "core/config.hpp"
#include "core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() /
               ("gw_config_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(test_dir);
    ::unsetenv(Config::Keys::ENV_BOT_TOKEN);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
    ::unsetenv(Config::Keys::ENV_BOT_TOKEN);
  }

  std::string createTestConfigFile(const std::string &content,
                                   const std::string &name = "test_config.ini") {
    auto config_path = test_dir / name;
    std::ofstream file(config_path);
    file << content;
    file.close();
    return config_path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsMatchSensitivityTable) {
  Config::AppConfig config;
  const auto &low = config.sensitivity_profiles.at(Config::SensitivityLevel::LOW);
  const auto &medium =
      config.sensitivity_profiles.at(Config::SensitivityLevel::MEDIUM);
  const auto &high =
      config.sensitivity_profiles.at(Config::SensitivityLevel::HIGH);

  EXPECT_EQ(low.rate_threshold, 8u);
  EXPECT_DOUBLE_EQ(low.duplicate_similarity, 0.80);
  EXPECT_EQ(low.duplicate_min_consecutive, 3u);
  EXPECT_DOUBLE_EQ(low.mute_threshold, 0.85);

  EXPECT_EQ(medium.rate_threshold, 5u);
  EXPECT_DOUBLE_EQ(medium.warn_threshold, 0.45);

  EXPECT_EQ(high.rate_threshold, 3u);
  EXPECT_DOUBLE_EQ(high.warn_threshold, 0.30);
  EXPECT_DOUBLE_EQ(high.mute_threshold, 0.60);
  EXPECT_EQ(high.rate_window_seconds, 10u);

  EXPECT_EQ(config.escalation.base_mute_seconds, 21600u);
  EXPECT_EQ(config.escalation.max_mute_seconds, 604800u);

  std::vector<std::string> errors;
  EXPECT_TRUE(Config::validate_app_config(config, errors));
  EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigTest, ParsesSectionsAndGuildOverrides) {
  std::string path = createTestConfigFile(R"(
# comment
[Engine]
window_duration_seconds = 300
worker_threads = 2

[Sensitivity.high]
rate_threshold = 4

[Rules]
scam_keywords = Nitro, Airdrop
link_weight = 0.5

[Escalation]
base_mute_seconds = 600

[Guild.123456789012345678]
sensitivity = high
mute_duration_seconds = 3600
link_enabled = false

[Guild.42]
sensitivity = low
warn_threshold = 0.5

[ActionExecutor]
api_base_url = http://localhost:8080/api
dry_run = yes

[Audit]
backend = FILE
max_entries_per_guild = 25
)");

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));
  auto config = manager.get_config();

  EXPECT_EQ(config->engine.window_duration_seconds, 300u);
  EXPECT_EQ(config->engine.worker_threads, 2u);
  EXPECT_EQ(config->rules.scam_keywords,
            (std::vector<std::string>{"nitro", "airdrop"}));
  EXPECT_DOUBLE_EQ(config->rules.link_weight, 0.5);
  EXPECT_TRUE(config->executor.dry_run);
  EXPECT_EQ(config->audit.backend, "file");
  EXPECT_EQ(config->audit.max_entries_per_guild, 25u);
  ASSERT_EQ(config->guilds.size(), 2u);

  auto big = Config::resolve_guild_settings(*config, 123456789012345678ULL);
  EXPECT_TRUE(big.configured);
  EXPECT_EQ(big.sensitivity, Config::SensitivityLevel::HIGH);
  EXPECT_EQ(big.profile.rate_threshold, 4u);
  EXPECT_EQ(big.base_mute_seconds, 3600u);
  EXPECT_FALSE(big.link_enabled);
  EXPECT_TRUE(big.rate_enabled);

  auto small = Config::resolve_guild_settings(*config, 42);
  EXPECT_EQ(small.sensitivity, Config::SensitivityLevel::LOW);
  EXPECT_DOUBLE_EQ(small.profile.warn_threshold, 0.5);
  EXPECT_DOUBLE_EQ(small.profile.mute_threshold, 0.85);
  EXPECT_EQ(small.base_mute_seconds, 600u);
}

TEST_F(ConfigTest, UnconfiguredGuildFallsBackToMedium) {
  Config::AppConfig config;
  auto settings = Config::resolve_guild_settings(config, 777);
  EXPECT_FALSE(settings.configured);
  EXPECT_EQ(settings.sensitivity, Config::SensitivityLevel::MEDIUM);
  EXPECT_EQ(settings.profile.rate_threshold, 5u);
  EXPECT_EQ(settings.base_mute_seconds, 21600u);
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
  std::string path = createTestConfigFile(R"(
[Engine]
worker_threads = many
[Guild.not_a_number]
sensitivity = high
)");

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));
  EXPECT_EQ(manager.get_config()->engine.worker_threads, 4u);
  EXPECT_TRUE(manager.get_config()->guilds.empty());
}

TEST_F(ConfigTest, RejectedReloadKeepsPreviousConfig) {
  std::string good = createTestConfigFile(R"(
[Engine]
worker_threads = 3
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(good));
  auto before = manager.get_config();

  std::string bad = createTestConfigFile(R"(
[Engine]
worker_threads = 6
[Sensitivity.medium]
warn_threshold = 0.9
mute_threshold = 0.5
)",
                                         "bad.ini");
  EXPECT_FALSE(manager.load_configuration(bad));
  EXPECT_EQ(manager.get_config(), before);
  EXPECT_EQ(manager.get_config()->engine.worker_threads, 3u);
}

TEST_F(ConfigTest, MissingFileIsNotApplied) {
  Config::ConfigManager manager;
  auto before = manager.get_config();
  EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
  EXPECT_EQ(manager.get_config(), before);
}

TEST_F(ConfigTest, ValidationCatchesBadValues) {
  Config::AppConfig config;
  config.audit.backend = "sqlite";
  config.executor.base_delay_ms = 5000;
  config.executor.max_delay_ms = 100;
  config.executor.api_base_url = "ftp://example.org";
  config.rules.rate_weight = -1.0;
  config.sensitivity_profiles[Config::SensitivityLevel::HIGH].rate_threshold = 0;
  config.sensitivity_profiles[Config::SensitivityLevel::LOW]
      .duplicate_min_consecutive = 1;

  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_app_config(config, errors));
  EXPECT_GE(errors.size(), 6u);
}

TEST_F(ConfigTest, UpdateAndRemoveGuild) {
  Config::ConfigManager manager;
  auto before = manager.get_config();

  Config::GuildConfig guild;
  guild.sensitivity = Config::SensitivityLevel::HIGH;
  guild.mute_duration_seconds = 120;
  ASSERT_TRUE(manager.update_guild(9, guild));

  // Snapshots taken earlier are not modified
  EXPECT_TRUE(before->guilds.empty());
  auto settings = Config::resolve_guild_settings(*manager.get_config(), 9);
  EXPECT_EQ(settings.sensitivity, Config::SensitivityLevel::HIGH);
  EXPECT_EQ(settings.base_mute_seconds, 120u);

  Config::GuildConfig invalid;
  invalid.warn_threshold = 0.9;
  invalid.mute_threshold = 0.2;
  EXPECT_FALSE(manager.update_guild(10, invalid));
  EXPECT_EQ(manager.get_config()->guilds.count(10), 0u);

  EXPECT_TRUE(manager.remove_guild(9));
  EXPECT_FALSE(manager.remove_guild(9));
  EXPECT_TRUE(manager.get_config()->guilds.empty());
}

TEST_F(ConfigTest, RuntimeGuildChangesSurviveReload) {
  std::string path = createTestConfigFile(R"(
[Engine]
worker_threads = 3
[Guild.5]
sensitivity = low
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));

  Config::GuildConfig guild;
  guild.sensitivity = Config::SensitivityLevel::HIGH;
  ASSERT_TRUE(manager.update_guild(9, guild));
  ASSERT_TRUE(manager.remove_guild(5));

  createTestConfigFile(R"(
[Engine]
worker_threads = 6
[Guild.5]
sensitivity = low
)");
  ASSERT_TRUE(manager.reload());

  auto config = manager.get_config();
  EXPECT_EQ(config->engine.worker_threads, 6u);
  EXPECT_EQ(config->guilds.count(5), 0u);
  ASSERT_EQ(config->guilds.count(9), 1u);
  EXPECT_EQ(config->guilds.at(9).sensitivity, Config::SensitivityLevel::HIGH);
}

TEST_F(ConfigTest, ConcurrentReloadAndGuildUpdatesLoseNothing) {
  std::string path = createTestConfigFile(R"(
[Engine]
worker_threads = 3
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));
  createTestConfigFile(R"(
[Engine]
worker_threads = 6
)");

  constexpr uint64_t GUILDS = 100;
  std::thread reloader([&manager] {
    for (int i = 0; i < 50; ++i)
      EXPECT_TRUE(manager.reload());
  });
  std::thread updater([&manager] {
    for (uint64_t id = 1; id <= GUILDS; ++id) {
      Config::GuildConfig guild;
      guild.mute_duration_seconds = id;
      EXPECT_TRUE(manager.update_guild(id, guild));
    }
  });
  reloader.join();
  updater.join();

  auto config = manager.get_config();
  EXPECT_EQ(config->engine.worker_threads, 6u);
  ASSERT_EQ(config->guilds.size(), GUILDS);
  EXPECT_EQ(config->guilds.at(42).mute_duration_seconds, 42u);
}

TEST_F(ConfigTest, ParsesContentScanAndRetryLimits) {
  std::string path = createTestConfigFile(R"(
[Rules]
spam_enabled = false
spam_weight = 0.5
spam_min_score = 0.6
max_scan_bytes = 1024

[ActionExecutor]
max_retry_after_ms = 15000

[Guild.7]
spam_enabled = true
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));
  auto config = manager.get_config();
  EXPECT_FALSE(config->rules.spam_enabled);
  EXPECT_DOUBLE_EQ(config->rules.spam_weight, 0.5);
  EXPECT_DOUBLE_EQ(config->rules.spam_min_score, 0.6);
  EXPECT_EQ(config->rules.max_scan_bytes, 1024u);
  EXPECT_EQ(config->executor.max_retry_after_ms, 15000u);

  EXPECT_TRUE(Config::resolve_guild_settings(*config, 7).spam_enabled);
  EXPECT_FALSE(Config::resolve_guild_settings(*config, 8).spam_enabled);

  Config::AppConfig bad;
  bad.rules.max_scan_bytes = 0;
  bad.rules.spam_min_score = 1.5;
  bad.executor.max_retry_after_ms = 0;
  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_app_config(bad, errors));
  EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigTest, LoggingLevelsWithWildcard) {
  std::string path = createTestConfigFile(R"(
[Logging]
default_level = ERROR
rules.* = DEBUG
executor = TRACE
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));
  const auto &levels = manager.get_config()->logging.log_levels;

  EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
  EXPECT_EQ(levels.at(LogComponent::RULES_RATE), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::RULES_LINK), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::EXECUTOR), LogLevel::TRACE);
  EXPECT_EQ(levels.at(LogComponent::DECISION), LogLevel::ERROR);
}

TEST_F(ConfigTest, BotTokenFromEnvironment) {
  std::string path = createTestConfigFile(R"(
[ActionExecutor]
bot_token = from_file
)");
  ::setenv(Config::Keys::ENV_BOT_TOKEN, "from_env", 1);

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(path));
  EXPECT_EQ(manager.get_config()->executor.bot_token, "from_env");
}

TEST_F(ConfigTest, ParseSensitivityIsCaseInsensitive) {
  auto level = Config::parse_sensitivity(" HIGH ");
  ASSERT_TRUE(level.has_value());
  EXPECT_EQ(*level, Config::SensitivityLevel::HIGH);
  EXPECT_FALSE(Config::parse_sensitivity("extreme").has_value());
  EXPECT_STREQ(Config::sensitivity_to_string(Config::SensitivityLevel::LOW),
               "low");
}
