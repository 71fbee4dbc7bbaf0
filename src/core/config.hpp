#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Engine Settings
constexpr const char *ENGINE_WINDOW_DURATION_SECONDS = "window_duration_seconds";
constexpr const char *ENGINE_WINDOW_MAX_MESSAGES = "window_max_messages";
constexpr const char *ENGINE_WORKER_THREADS = "worker_threads";
constexpr const char *ENGINE_WORKER_QUEUE_CAPACITY = "worker_queue_capacity";
constexpr const char *ENGINE_SHARD_COUNT = "shard_count";
constexpr const char *ENGINE_SWEEP_INTERVAL_SECONDS = "sweep_interval_seconds";

// Sensitivity.<level> Settings
constexpr const char *SENS_RATE_THRESHOLD = "rate_threshold";
constexpr const char *SENS_RATE_WINDOW_SECONDS = "rate_window_seconds";
constexpr const char *SENS_DUPLICATE_SIMILARITY = "duplicate_similarity";
constexpr const char *SENS_DUPLICATE_MIN_CONSECUTIVE =
    "duplicate_min_consecutive";
constexpr const char *SENS_WARN_THRESHOLD = "warn_threshold";
constexpr const char *SENS_MUTE_THRESHOLD = "mute_threshold";

// Rules Settings
constexpr const char *RULES_RATE_ENABLED = "rate_enabled";
constexpr const char *RULES_DUPLICATE_ENABLED = "duplicate_enabled";
constexpr const char *RULES_LINK_ENABLED = "link_enabled";
constexpr const char *RULES_ACCOUNT_RISK_ENABLED = "account_risk_enabled";
constexpr const char *RULES_SPAM_ENABLED = "spam_enabled";
constexpr const char *RULES_RATE_WEIGHT = "rate_weight";
constexpr const char *RULES_DUPLICATE_WEIGHT = "duplicate_weight";
constexpr const char *RULES_LINK_WEIGHT = "link_weight";
constexpr const char *RULES_SPAM_WEIGHT = "spam_weight";
constexpr const char *RULES_SPAM_MIN_SCORE = "spam_min_score";
constexpr const char *RULES_MAX_SCAN_BYTES = "max_scan_bytes";
constexpr const char *RULES_DUPLICATE_LOOKBACK = "duplicate_lookback";
constexpr const char *RULES_FINGERPRINT_MAX_LENGTH = "fingerprint_max_length";
constexpr const char *RULES_DENYLIST_DOMAINS = "denylist_domains";
constexpr const char *RULES_SUSPICIOUS_TLDS = "suspicious_tlds";
constexpr const char *RULES_SCAM_KEYWORDS = "scam_keywords";
constexpr const char *RULES_ALLOWLIST_DOMAINS = "allowlist_domains";
constexpr const char *RULES_MASS_MENTION_TOKENS = "mass_mention_tokens";
constexpr const char *RULES_DENYLIST_CONFIDENCE = "denylist_confidence";
constexpr const char *RULES_SCAM_CONFIDENCE = "scam_confidence";
constexpr const char *RULES_NEW_ACCOUNT_AGE_DAYS = "new_account_age_days";
constexpr const char *RULES_NEW_MEMBER_MINUTES = "new_member_minutes";
constexpr const char *RULES_NEW_ACCOUNT_MULTIPLIER = "new_account_multiplier";

// Escalation Settings
constexpr const char *ESC_BASE_MUTE_SECONDS = "base_mute_seconds";
constexpr const char *ESC_WINDOW_SECONDS = "escalation_window_seconds";
constexpr const char *ESC_MAX_MUTE_SECONDS = "max_mute_seconds";
constexpr const char *ESC_FACTOR = "escalation_factor";
constexpr const char *ESC_DELETE_OFFENDING_MESSAGE = "delete_offending_message";
constexpr const char *ESC_DELETE_UNSAFE_LINKS = "delete_unsafe_links";

// Guild.<id> Settings
constexpr const char *GUILD_SENSITIVITY = "sensitivity";
constexpr const char *GUILD_MUTE_DURATION_SECONDS = "mute_duration_seconds";

// ActionExecutor Settings
constexpr const char *EXEC_API_BASE_URL = "api_base_url";
constexpr const char *EXEC_BOT_TOKEN = "bot_token";
constexpr const char *EXEC_REQUEST_TIMEOUT_MS = "request_timeout_ms";
constexpr const char *EXEC_MAX_ATTEMPTS = "max_attempts";
constexpr const char *EXEC_BASE_DELAY_MS = "base_delay_ms";
constexpr const char *EXEC_MAX_DELAY_MS = "max_delay_ms";
constexpr const char *EXEC_MAX_RETRY_AFTER_MS = "max_retry_after_ms";
constexpr const char *EXEC_BACKOFF_MULTIPLIER = "backoff_multiplier";
constexpr const char *EXEC_JITTER_MIN = "jitter_min";
constexpr const char *EXEC_JITTER_MAX = "jitter_max";
constexpr const char *EXEC_WORKER_THREADS = "worker_threads";
constexpr const char *EXEC_QUEUE_CAPACITY = "queue_capacity";
constexpr const char *EXEC_DRY_RUN = "dry_run";

// CircuitBreaker Settings
constexpr const char *CB_FAILURE_THRESHOLD = "failure_threshold";
constexpr const char *CB_COOL_DOWN_SECONDS = "cool_down_seconds";

// Audit Settings
constexpr const char *AUDIT_BACKEND = "backend";
constexpr const char *AUDIT_FILE_PATH = "file_path";
constexpr const char *AUDIT_MONGO_URI = "mongo_uri";
constexpr const char *AUDIT_MONGO_DATABASE = "mongo_database";
constexpr const char *AUDIT_MONGO_COLLECTION = "mongo_collection";
constexpr const char *AUDIT_MAX_ENTRIES_PER_GUILD = "max_entries_per_guild";
constexpr const char *AUDIT_LOG_NONE_DECISIONS = "log_none_decisions";

// Ingest Settings
constexpr const char *INGEST_SOURCE_PATH = "source_path";
constexpr const char *INGEST_FOLLOW = "follow";
constexpr const char *INGEST_POLL_INTERVAL_MS = "poll_interval_ms";

// Monitoring Settings
constexpr const char *MONITORING_WEB_SERVER_ENABLED = "web_server_enabled";
constexpr const char *MONITORING_WEB_SERVER_HOST = "web_server_host";
constexpr const char *MONITORING_WEB_SERVER_PORT = "web_server_port";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Environment
constexpr const char *ENV_BOT_TOKEN = "GW_BOT_TOKEN";

} // namespace Keys

enum class SensitivityLevel { LOW, MEDIUM, HIGH };

const char *sensitivity_to_string(SensitivityLevel level);
std::optional<SensitivityLevel> parse_sensitivity(std::string_view text);

// Thresholds selected by a sensitivity level
struct SensitivityProfile {
  size_t rate_threshold = 5;
  uint64_t rate_window_seconds = 10;
  double duplicate_similarity = 0.70;
  size_t duplicate_min_consecutive = 2;
  double warn_threshold = 0.45;
  double mute_threshold = 0.75;
};

SensitivityProfile default_profile(SensitivityLevel level);

struct EngineConfig {
  uint64_t window_duration_seconds = 600;
  size_t window_max_messages = 50;
  size_t worker_threads = 4;
  size_t worker_queue_capacity = 1024;
  size_t shard_count = 64;
  uint64_t sweep_interval_seconds = 60;
};

struct RulesConfig {
  bool rate_enabled = true;
  bool duplicate_enabled = true;
  bool link_enabled = true;
  bool account_risk_enabled = true;
  bool spam_enabled = true;

  double rate_weight = 1.0;
  double duplicate_weight = 1.0;
  double link_weight = 1.0;
  double spam_weight = 1.0;

  size_t duplicate_lookback = 10;
  size_t fingerprint_max_length = 256;
  // Content rules only look at this many leading bytes of a message
  size_t max_scan_bytes = 4096;
  double spam_min_score = 0.5;

  std::vector<std::string> denylist_domains = {
      "dlscord.gift",       "discordgift.site", "discord-nitro.com",
      "steamcommunlty.com", "grabify.link",     "iplogger.org"};
  std::vector<std::string> suspicious_tlds = {".tk", ".ml", ".ga", ".cf"};
  std::vector<std::string> scam_keywords = {"nitro",   "gift",     "free",
                                            "giveaway", "airdrop", "steam"};
  std::vector<std::string> allowlist_domains = {
      "discord.com", "discord.gg", "github.com", "youtube.com",
      "youtu.be",    "twitter.com", "x.com",     "wikipedia.org"};
  std::vector<std::string> mass_mention_tokens = {"@everyone", "@here"};

  double denylist_confidence = 1.0;
  double scam_confidence = 0.7;

  uint64_t new_account_age_days = 7;
  uint64_t new_member_minutes = 10;
  double new_account_multiplier = 1.5;
};

struct EscalationConfig {
  uint64_t base_mute_seconds = 21600;         // 6 hours
  uint64_t escalation_window_seconds = 86400; // 24 hours
  uint64_t max_mute_seconds = 604800;         // 7 days
  double escalation_factor = 2.0;
  bool delete_offending_message = true;
  bool delete_unsafe_links = true;
};

// Per-guild overrides. Unset fields inherit the sensitivity profile or the
// global rule and escalation settings.
struct GuildConfig {
  SensitivityLevel sensitivity = SensitivityLevel::MEDIUM;
  std::optional<uint64_t> mute_duration_seconds;

  std::optional<bool> rate_enabled;
  std::optional<bool> duplicate_enabled;
  std::optional<bool> link_enabled;
  std::optional<bool> account_risk_enabled;
  std::optional<bool> spam_enabled;

  std::optional<size_t> rate_threshold;
  std::optional<double> duplicate_similarity;
  std::optional<size_t> duplicate_min_consecutive;
  std::optional<double> warn_threshold;
  std::optional<double> mute_threshold;
};

struct ActionExecutorConfig {
  std::string api_base_url = "https://discord.com/api/v10";
  std::string bot_token;
  uint32_t request_timeout_ms = 5000;
  size_t max_attempts = 3;
  uint64_t base_delay_ms = 1000;
  uint64_t max_delay_ms = 32000;
  // Longer server wait hints end the call instead of being waited out
  uint64_t max_retry_after_ms = 60000;
  double backoff_multiplier = 2.0;
  double jitter_min = 0.75;
  double jitter_max = 1.0;
  size_t worker_threads = 2;
  size_t queue_capacity = 1024;
  bool dry_run = false;
};

struct CircuitBreakerConfig {
  size_t failure_threshold = 5;
  uint64_t cool_down_seconds = 60;
};

struct AuditConfig {
  std::string backend = "file";
  std::string file_path = "data/audit_log.jsonl";
  std::string mongo_uri = "mongodb://localhost:27017";
  std::string mongo_database = "guild_warden";
  std::string mongo_collection = "audit_log";
  size_t max_entries_per_guild = 10000;
  bool log_none_decisions = false;
};

struct IngestConfig {
  std::string source_path = "-"; // "-" reads standard input
  bool follow = false;
  uint64_t poll_interval_ms = 200;
};

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct MonitoringConfig {
  bool web_server_enabled = true;
  std::string web_server_host = "0.0.0.0";
  int web_server_port = 9090;
};

struct AppConfig {
  EngineConfig engine;
  std::map<SensitivityLevel, SensitivityProfile> sensitivity_profiles;
  RulesConfig rules;
  EscalationConfig escalation;
  std::unordered_map<uint64_t, GuildConfig> guilds;
  ActionExecutorConfig executor;
  CircuitBreakerConfig circuit_breaker;
  AuditConfig audit;
  IngestConfig ingest;
  LoggingConfig logging;
  MonitoringConfig monitoring;

  AppConfig();
};

// Settings one evaluation runs with, after guild overrides are applied
struct GuildSettings {
  uint64_t guild_id = 0;
  bool configured = false; // false when the guild had no entry
  SensitivityLevel sensitivity = SensitivityLevel::MEDIUM;
  SensitivityProfile profile;
  bool rate_enabled = true;
  bool duplicate_enabled = true;
  bool link_enabled = true;
  bool account_risk_enabled = true;
  bool spam_enabled = true;
  uint64_t base_mute_seconds = 21600;
};

GuildSettings resolve_guild_settings(const AppConfig &config,
                                     uint64_t guild_id);

// Validation functions for configuration parameters
bool validate_sensitivity_profile(SensitivityLevel level,
                                  const SensitivityProfile &profile,
                                  std::vector<std::string> &errors);
bool validate_guild_config(uint64_t guild_id, const GuildConfig &config,
                           std::vector<std::string> &errors);
bool validate_executor_config(const ActionExecutorConfig &config,
                              std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

// Owns the current configuration snapshot. Readers take a shared_ptr once
// per evaluation; writers build a new AppConfig and swap it in.
class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  bool reload();
  bool apply(std::shared_ptr<const AppConfig> new_config);
  bool update_guild(uint64_t guild_id, const GuildConfig &guild_config);
  bool remove_guild(uint64_t guild_id);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  bool load_locked(const std::string &filepath);
  bool apply_locked(std::shared_ptr<const AppConfig> new_config);

  std::string config_filepath_;
  // Guild changes made at runtime, reapplied over every file load.
  // An empty value records a removal.
  std::map<uint64_t, std::optional<GuildConfig>> runtime_guilds_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
  std::mutex update_mutex_; // serializes every writer of current_config_
};

} // namespace Config

#endif // CONFIG_HPP
