#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

namespace {

constexpr const char *SENSITIVITY_SECTION_PREFIX = "Sensitivity.";
constexpr const char *GUILD_SECTION_PREFIX = "Guild.";

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.ingest", LogComponent::IO_INGEST},
    {"io.api", LogComponent::IO_API},
    {"io.audit", LogComponent::IO_AUDIT},
    {"io.database", LogComponent::IO_DATABASE},
    {"io.web", LogComponent::IO_WEB},
    {"window", LogComponent::WINDOW},
    {"rules.eval", LogComponent::RULES_EVAL},
    {"rules.rate", LogComponent::RULES_RATE},
    {"rules.duplicate", LogComponent::RULES_DUPLICATE},
    {"rules.link", LogComponent::RULES_LINK},
    {"rules.account", LogComponent::RULES_ACCOUNT},
    {"rules.spam", LogComponent::RULES_SPAM},
    {"decision", LogComponent::DECISION},
    {"escalation", LogComponent::ESCALATION},
    {"executor", LogComponent::EXECUTOR},
    {"circuit", LogComponent::CIRCUIT}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

void warn_invalid_value(const std::string &key, const std::string &value,
                        int line_num) {
  std::cerr << "Warning (Config Line " << line_num
            << "): Invalid value for key '" << key << "': '" << value << "'"
            << std::endl;
}

// Parses value into target, keeping the previous value when the text is not
// a number of the target's type
template <typename T>
void assign_number(T &target, const std::string &key, const std::string &value,
                   int line_num) {
  if (auto parsed = Utils::string_to_number<T>(value))
    target = *parsed;
  else
    warn_invalid_value(key, value, line_num);
}

template <typename T>
void assign_optional_number(std::optional<T> &target, const std::string &key,
                            const std::string &value, int line_num) {
  if (auto parsed = Utils::string_to_number<T>(value))
    target = *parsed;
  else
    warn_invalid_value(key, value, line_num);
}

void parse_sensitivity_key(SensitivityProfile &profile, const std::string &key,
                           const std::string &value, int line_num) {
  if (key == Keys::SENS_RATE_THRESHOLD)
    assign_number(profile.rate_threshold, key, value, line_num);
  else if (key == Keys::SENS_RATE_WINDOW_SECONDS)
    assign_number(profile.rate_window_seconds, key, value, line_num);
  else if (key == Keys::SENS_DUPLICATE_SIMILARITY)
    assign_number(profile.duplicate_similarity, key, value, line_num);
  else if (key == Keys::SENS_DUPLICATE_MIN_CONSECUTIVE)
    assign_number(profile.duplicate_min_consecutive, key, value, line_num);
  else if (key == Keys::SENS_WARN_THRESHOLD)
    assign_number(profile.warn_threshold, key, value, line_num);
  else if (key == Keys::SENS_MUTE_THRESHOLD)
    assign_number(profile.mute_threshold, key, value, line_num);
}

void parse_guild_key(GuildConfig &guild, const std::string &key,
                     const std::string &value, int line_num) {
  if (key == Keys::GUILD_SENSITIVITY) {
    if (auto level = parse_sensitivity(value))
      guild.sensitivity = *level;
    else
      std::cerr << "Warning (Config Line " << line_num
                << "): Unknown sensitivity '" << value << "'" << std::endl;
  } else if (key == Keys::GUILD_MUTE_DURATION_SECONDS)
    assign_optional_number(guild.mute_duration_seconds, key, value, line_num);
  else if (key == Keys::RULES_RATE_ENABLED)
    guild.rate_enabled = string_to_bool(value);
  else if (key == Keys::RULES_DUPLICATE_ENABLED)
    guild.duplicate_enabled = string_to_bool(value);
  else if (key == Keys::RULES_LINK_ENABLED)
    guild.link_enabled = string_to_bool(value);
  else if (key == Keys::RULES_ACCOUNT_RISK_ENABLED)
    guild.account_risk_enabled = string_to_bool(value);
  else if (key == Keys::RULES_SPAM_ENABLED)
    guild.spam_enabled = string_to_bool(value);
  else if (key == Keys::SENS_RATE_THRESHOLD)
    assign_optional_number(guild.rate_threshold, key, value, line_num);
  else if (key == Keys::SENS_DUPLICATE_SIMILARITY)
    assign_optional_number(guild.duplicate_similarity, key, value, line_num);
  else if (key == Keys::SENS_DUPLICATE_MIN_CONSECUTIVE)
    assign_optional_number(guild.duplicate_min_consecutive, key, value,
                           line_num);
  else if (key == Keys::SENS_WARN_THRESHOLD)
    assign_optional_number(guild.warn_threshold, key, value, line_num);
  else if (key == Keys::SENS_MUTE_THRESHOLD)
    assign_optional_number(guild.mute_threshold, key, value, line_num);
}

bool in_unit_interval(double value) { return value >= 0.0 && value <= 1.0; }

} // namespace

const char *sensitivity_to_string(SensitivityLevel level) {
  switch (level) {
  case SensitivityLevel::LOW:
    return "low";
  case SensitivityLevel::MEDIUM:
    return "medium";
  case SensitivityLevel::HIGH:
    return "high";
  }
  return "medium";
}

std::optional<SensitivityLevel> parse_sensitivity(std::string_view text) {
  std::string level = Utils::to_lower_copy(Utils::trim_copy(text));
  if (level == "low")
    return SensitivityLevel::LOW;
  if (level == "medium")
    return SensitivityLevel::MEDIUM;
  if (level == "high")
    return SensitivityLevel::HIGH;
  return std::nullopt;
}

SensitivityProfile default_profile(SensitivityLevel level) {
  SensitivityProfile profile;
  switch (level) {
  case SensitivityLevel::LOW:
    profile.rate_threshold = 8;
    profile.duplicate_similarity = 0.80;
    profile.duplicate_min_consecutive = 3;
    profile.warn_threshold = 0.60;
    profile.mute_threshold = 0.85;
    break;
  case SensitivityLevel::MEDIUM:
    profile.rate_threshold = 5;
    profile.duplicate_similarity = 0.70;
    profile.duplicate_min_consecutive = 2;
    profile.warn_threshold = 0.45;
    profile.mute_threshold = 0.75;
    break;
  case SensitivityLevel::HIGH:
    profile.rate_threshold = 3;
    profile.duplicate_similarity = 0.60;
    profile.duplicate_min_consecutive = 2;
    profile.warn_threshold = 0.30;
    profile.mute_threshold = 0.60;
    break;
  }
  return profile;
}

AppConfig::AppConfig() {
  for (auto level : {SensitivityLevel::LOW, SensitivityLevel::MEDIUM,
                     SensitivityLevel::HIGH})
    sensitivity_profiles[level] = default_profile(level);
}

GuildSettings resolve_guild_settings(const AppConfig &config,
                                     uint64_t guild_id) {
  GuildSettings settings;
  settings.guild_id = guild_id;
  settings.rate_enabled = config.rules.rate_enabled;
  settings.duplicate_enabled = config.rules.duplicate_enabled;
  settings.link_enabled = config.rules.link_enabled;
  settings.account_risk_enabled = config.rules.account_risk_enabled;
  settings.spam_enabled = config.rules.spam_enabled;
  settings.base_mute_seconds = config.escalation.base_mute_seconds;

  auto guild_it = config.guilds.find(guild_id);
  settings.configured = guild_it != config.guilds.end();
  settings.sensitivity = settings.configured ? guild_it->second.sensitivity
                                             : SensitivityLevel::MEDIUM;

  auto profile_it = config.sensitivity_profiles.find(settings.sensitivity);
  settings.profile = profile_it != config.sensitivity_profiles.end()
                         ? profile_it->second
                         : default_profile(settings.sensitivity);

  if (!settings.configured)
    return settings;

  const GuildConfig &guild = guild_it->second;
  settings.rate_enabled = guild.rate_enabled.value_or(settings.rate_enabled);
  settings.duplicate_enabled =
      guild.duplicate_enabled.value_or(settings.duplicate_enabled);
  settings.link_enabled = guild.link_enabled.value_or(settings.link_enabled);
  settings.account_risk_enabled =
      guild.account_risk_enabled.value_or(settings.account_risk_enabled);
  settings.spam_enabled = guild.spam_enabled.value_or(settings.spam_enabled);
  settings.base_mute_seconds =
      guild.mute_duration_seconds.value_or(settings.base_mute_seconds);

  SensitivityProfile &profile = settings.profile;
  profile.rate_threshold = guild.rate_threshold.value_or(profile.rate_threshold);
  profile.duplicate_similarity =
      guild.duplicate_similarity.value_or(profile.duplicate_similarity);
  profile.duplicate_min_consecutive = guild.duplicate_min_consecutive.value_or(
      profile.duplicate_min_consecutive);
  profile.warn_threshold = guild.warn_threshold.value_or(profile.warn_threshold);
  profile.mute_threshold = guild.mute_threshold.value_or(profile.mute_threshold);
  return settings;
}

bool validate_sensitivity_profile(SensitivityLevel level,
                                  const SensitivityProfile &profile,
                                  std::vector<std::string> &errors) {
  bool valid = true;
  std::string name = std::string("Sensitivity.") + sensitivity_to_string(level);

  if (profile.rate_threshold == 0) {
    errors.push_back(name + " rate_threshold must be at least 1");
    valid = false;
  }
  if (profile.rate_window_seconds == 0) {
    errors.push_back(name + " rate_window_seconds must be greater than 0");
    valid = false;
  }
  if (!in_unit_interval(profile.duplicate_similarity)) {
    errors.push_back(name + " duplicate_similarity must be within [0, 1]");
    valid = false;
  }
  if (profile.duplicate_min_consecutive < 2) {
    errors.push_back(name + " duplicate_min_consecutive must be at least 2");
    valid = false;
  }
  if (!in_unit_interval(profile.warn_threshold) ||
      !in_unit_interval(profile.mute_threshold)) {
    errors.push_back(name + " warn and mute thresholds must be within [0, 1]");
    valid = false;
  } else if (profile.warn_threshold >= profile.mute_threshold) {
    errors.push_back(name + " warn_threshold must be below mute_threshold");
    valid = false;
  }
  return valid;
}

bool validate_guild_config(uint64_t guild_id, const GuildConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;
  std::string name = "Guild." + std::to_string(guild_id);

  if (config.mute_duration_seconds && *config.mute_duration_seconds == 0) {
    errors.push_back(name + " mute_duration_seconds must be greater than 0");
    valid = false;
  }
  if (config.rate_threshold && *config.rate_threshold == 0) {
    errors.push_back(name + " rate_threshold must be at least 1");
    valid = false;
  }
  if (config.duplicate_similarity &&
      !in_unit_interval(*config.duplicate_similarity)) {
    errors.push_back(name + " duplicate_similarity must be within [0, 1]");
    valid = false;
  }
  if (config.duplicate_min_consecutive &&
      *config.duplicate_min_consecutive < 2) {
    errors.push_back(name + " duplicate_min_consecutive must be at least 2");
    valid = false;
  }
  if ((config.warn_threshold && !in_unit_interval(*config.warn_threshold)) ||
      (config.mute_threshold && !in_unit_interval(*config.mute_threshold))) {
    errors.push_back(name + " warn and mute thresholds must be within [0, 1]");
    valid = false;
  }
  return valid;
}

bool validate_executor_config(const ActionExecutorConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_attempts == 0) {
    errors.push_back("ActionExecutor max_attempts must be at least 1");
    valid = false;
  }
  if (config.base_delay_ms > config.max_delay_ms) {
    errors.push_back("ActionExecutor base_delay_ms cannot exceed max_delay_ms");
    valid = false;
  }
  if (config.max_retry_after_ms == 0) {
    errors.push_back("ActionExecutor max_retry_after_ms must be at least 1");
    valid = false;
  }
  if (config.backoff_multiplier < 1.0) {
    errors.push_back("ActionExecutor backoff_multiplier must be at least 1.0");
    valid = false;
  }
  if (config.jitter_min <= 0.0 || config.jitter_min > config.jitter_max ||
      config.jitter_max > 1.0) {
    errors.push_back(
        "ActionExecutor jitter must satisfy 0 < jitter_min <= jitter_max <= 1");
    valid = false;
  }
  if (config.worker_threads == 0) {
    errors.push_back("ActionExecutor worker_threads must be at least 1");
    valid = false;
  }
  if (config.api_base_url.rfind("http://", 0) != 0 &&
      config.api_base_url.rfind("https://", 0) != 0) {
    errors.push_back("ActionExecutor api_base_url must start with http:// or "
                     "https://");
    valid = false;
  }
  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.engine.window_max_messages == 0 ||
      config.engine.window_duration_seconds == 0) {
    errors.push_back("Engine window bounds must be greater than 0");
    valid = false;
  }
  if (config.engine.worker_threads == 0 || config.engine.shard_count == 0 ||
      config.engine.worker_queue_capacity == 0) {
    errors.push_back(
        "Engine worker_threads, shard_count and worker_queue_capacity must be "
        "greater than 0");
    valid = false;
  }

  for (const auto &[level, profile] : config.sensitivity_profiles)
    if (!validate_sensitivity_profile(level, profile, errors))
      valid = false;

  for (const auto &[guild_id, guild] : config.guilds) {
    if (!validate_guild_config(guild_id, guild, errors)) {
      valid = false;
      continue;
    }
    // Overrides combine with the inherited profile
    GuildSettings settings = resolve_guild_settings(config, guild_id);
    if (settings.profile.warn_threshold >= settings.profile.mute_threshold) {
      errors.push_back("Guild." + std::to_string(guild_id) +
                       " effective warn_threshold must be below "
                       "mute_threshold");
      valid = false;
    }
  }

  if (config.rules.rate_weight < 0.0 || config.rules.duplicate_weight < 0.0 ||
      config.rules.link_weight < 0.0 || config.rules.spam_weight < 0.0) {
    errors.push_back("Rules weights cannot be negative");
    valid = false;
  }
  if (config.rules.new_account_multiplier < 1.0) {
    errors.push_back("Rules new_account_multiplier must be at least 1.0");
    valid = false;
  }
  if (config.rules.duplicate_lookback == 0) {
    errors.push_back("Rules duplicate_lookback must be at least 1");
    valid = false;
  }
  if (config.rules.max_scan_bytes == 0) {
    errors.push_back("Rules max_scan_bytes must be at least 1");
    valid = false;
  }
  if (config.rules.spam_min_score <= 0.0 || config.rules.spam_min_score > 1.0) {
    errors.push_back("Rules spam_min_score must be within (0, 1]");
    valid = false;
  }

  if (config.escalation.base_mute_seconds == 0 ||
      config.escalation.base_mute_seconds > config.escalation.max_mute_seconds) {
    errors.push_back(
        "Escalation base_mute_seconds must be within (0, max_mute_seconds]");
    valid = false;
  }
  if (config.escalation.escalation_factor < 1.0) {
    errors.push_back("Escalation escalation_factor must be at least 1.0");
    valid = false;
  }

  if (!validate_executor_config(config.executor, errors))
    valid = false;

  if (config.circuit_breaker.failure_threshold == 0) {
    errors.push_back("CircuitBreaker failure_threshold must be at least 1");
    valid = false;
  }

  if (config.audit.backend != "file" && config.audit.backend != "mongodb") {
    errors.push_back("Audit backend must be 'file' or 'mongodb'");
    valid = false;
  }
  if (config.audit.backend == "file" && config.audit.file_path.empty()) {
    errors.push_back("Audit file_path is required for the file backend");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::ifstream config_file(filepath);
  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;
  GuildConfig *current_guild = nullptr;
  SensitivityProfile *current_profile = nullptr;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      current_guild = nullptr;
      current_profile = nullptr;

      if (current_section.rfind(GUILD_SECTION_PREFIX, 0) == 0) {
        auto guild_id = Utils::string_to_number<uint64_t>(
            current_section.substr(std::string(GUILD_SECTION_PREFIX).size()));
        if (guild_id)
          current_guild = &config.guilds[*guild_id];
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Invalid guild id in section [" << current_section
                    << "], section ignored." << std::endl;
      } else if (current_section.rfind(SENSITIVITY_SECTION_PREFIX, 0) == 0) {
        auto level = parse_sensitivity(current_section.substr(
            std::string(SENSITIVITY_SECTION_PREFIX).size()));
        if (level)
          current_profile = &config.sensitivity_profiles[*level];
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown sensitivity section [" << current_section
                    << "], section ignored." << std::endl;
      }
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    if (current_guild != nullptr) {
      parse_guild_key(*current_guild, key, value, line_num);

    } else if (current_profile != nullptr) {
      parse_sensitivity_key(*current_profile, key, value, line_num);

    } else if (current_section == "Engine") {
      if (key == Keys::ENGINE_WINDOW_DURATION_SECONDS)
        assign_number(config.engine.window_duration_seconds, key, value,
                      line_num);
      else if (key == Keys::ENGINE_WINDOW_MAX_MESSAGES)
        assign_number(config.engine.window_max_messages, key, value, line_num);
      else if (key == Keys::ENGINE_WORKER_THREADS)
        assign_number(config.engine.worker_threads, key, value, line_num);
      else if (key == Keys::ENGINE_WORKER_QUEUE_CAPACITY)
        assign_number(config.engine.worker_queue_capacity, key, value,
                      line_num);
      else if (key == Keys::ENGINE_SHARD_COUNT)
        assign_number(config.engine.shard_count, key, value, line_num);
      else if (key == Keys::ENGINE_SWEEP_INTERVAL_SECONDS)
        assign_number(config.engine.sweep_interval_seconds, key, value,
                      line_num);

    } else if (current_section == "Rules") {
      auto &rules = config.rules;
      if (key == Keys::RULES_RATE_ENABLED)
        rules.rate_enabled = string_to_bool(value);
      else if (key == Keys::RULES_DUPLICATE_ENABLED)
        rules.duplicate_enabled = string_to_bool(value);
      else if (key == Keys::RULES_LINK_ENABLED)
        rules.link_enabled = string_to_bool(value);
      else if (key == Keys::RULES_ACCOUNT_RISK_ENABLED)
        rules.account_risk_enabled = string_to_bool(value);
      else if (key == Keys::RULES_SPAM_ENABLED)
        rules.spam_enabled = string_to_bool(value);
      else if (key == Keys::RULES_RATE_WEIGHT)
        assign_number(rules.rate_weight, key, value, line_num);
      else if (key == Keys::RULES_DUPLICATE_WEIGHT)
        assign_number(rules.duplicate_weight, key, value, line_num);
      else if (key == Keys::RULES_LINK_WEIGHT)
        assign_number(rules.link_weight, key, value, line_num);
      else if (key == Keys::RULES_SPAM_WEIGHT)
        assign_number(rules.spam_weight, key, value, line_num);
      else if (key == Keys::RULES_SPAM_MIN_SCORE)
        assign_number(rules.spam_min_score, key, value, line_num);
      else if (key == Keys::RULES_MAX_SCAN_BYTES)
        assign_number(rules.max_scan_bytes, key, value, line_num);
      else if (key == Keys::RULES_DUPLICATE_LOOKBACK)
        assign_number(rules.duplicate_lookback, key, value, line_num);
      else if (key == Keys::RULES_FINGERPRINT_MAX_LENGTH)
        assign_number(rules.fingerprint_max_length, key, value, line_num);
      else if (key == Keys::RULES_DENYLIST_DOMAINS)
        rules.denylist_domains = Utils::parse_list(Utils::to_lower_copy(value));
      else if (key == Keys::RULES_SUSPICIOUS_TLDS)
        rules.suspicious_tlds = Utils::parse_list(Utils::to_lower_copy(value));
      else if (key == Keys::RULES_SCAM_KEYWORDS)
        rules.scam_keywords = Utils::parse_list(Utils::to_lower_copy(value));
      else if (key == Keys::RULES_ALLOWLIST_DOMAINS)
        rules.allowlist_domains =
            Utils::parse_list(Utils::to_lower_copy(value));
      else if (key == Keys::RULES_MASS_MENTION_TOKENS)
        rules.mass_mention_tokens =
            Utils::parse_list(Utils::to_lower_copy(value));
      else if (key == Keys::RULES_DENYLIST_CONFIDENCE)
        assign_number(rules.denylist_confidence, key, value, line_num);
      else if (key == Keys::RULES_SCAM_CONFIDENCE)
        assign_number(rules.scam_confidence, key, value, line_num);
      else if (key == Keys::RULES_NEW_ACCOUNT_AGE_DAYS)
        assign_number(rules.new_account_age_days, key, value, line_num);
      else if (key == Keys::RULES_NEW_MEMBER_MINUTES)
        assign_number(rules.new_member_minutes, key, value, line_num);
      else if (key == Keys::RULES_NEW_ACCOUNT_MULTIPLIER)
        assign_number(rules.new_account_multiplier, key, value, line_num);

    } else if (current_section == "Escalation") {
      auto &esc = config.escalation;
      if (key == Keys::ESC_BASE_MUTE_SECONDS)
        assign_number(esc.base_mute_seconds, key, value, line_num);
      else if (key == Keys::ESC_WINDOW_SECONDS)
        assign_number(esc.escalation_window_seconds, key, value, line_num);
      else if (key == Keys::ESC_MAX_MUTE_SECONDS)
        assign_number(esc.max_mute_seconds, key, value, line_num);
      else if (key == Keys::ESC_FACTOR)
        assign_number(esc.escalation_factor, key, value, line_num);
      else if (key == Keys::ESC_DELETE_OFFENDING_MESSAGE)
        esc.delete_offending_message = string_to_bool(value);
      else if (key == Keys::ESC_DELETE_UNSAFE_LINKS)
        esc.delete_unsafe_links = string_to_bool(value);

    } else if (current_section == "ActionExecutor") {
      auto &exec = config.executor;
      if (key == Keys::EXEC_API_BASE_URL)
        exec.api_base_url = value;
      else if (key == Keys::EXEC_BOT_TOKEN)
        exec.bot_token = value;
      else if (key == Keys::EXEC_REQUEST_TIMEOUT_MS)
        assign_number(exec.request_timeout_ms, key, value, line_num);
      else if (key == Keys::EXEC_MAX_ATTEMPTS)
        assign_number(exec.max_attempts, key, value, line_num);
      else if (key == Keys::EXEC_BASE_DELAY_MS)
        assign_number(exec.base_delay_ms, key, value, line_num);
      else if (key == Keys::EXEC_MAX_DELAY_MS)
        assign_number(exec.max_delay_ms, key, value, line_num);
      else if (key == Keys::EXEC_MAX_RETRY_AFTER_MS)
        assign_number(exec.max_retry_after_ms, key, value, line_num);
      else if (key == Keys::EXEC_BACKOFF_MULTIPLIER)
        assign_number(exec.backoff_multiplier, key, value, line_num);
      else if (key == Keys::EXEC_JITTER_MIN)
        assign_number(exec.jitter_min, key, value, line_num);
      else if (key == Keys::EXEC_JITTER_MAX)
        assign_number(exec.jitter_max, key, value, line_num);
      else if (key == Keys::EXEC_WORKER_THREADS)
        assign_number(exec.worker_threads, key, value, line_num);
      else if (key == Keys::EXEC_QUEUE_CAPACITY)
        assign_number(exec.queue_capacity, key, value, line_num);
      else if (key == Keys::EXEC_DRY_RUN)
        exec.dry_run = string_to_bool(value);

    } else if (current_section == "CircuitBreaker") {
      if (key == Keys::CB_FAILURE_THRESHOLD)
        assign_number(config.circuit_breaker.failure_threshold, key, value,
                      line_num);
      else if (key == Keys::CB_COOL_DOWN_SECONDS)
        assign_number(config.circuit_breaker.cool_down_seconds, key, value,
                      line_num);

    } else if (current_section == "Audit") {
      auto &audit = config.audit;
      if (key == Keys::AUDIT_BACKEND)
        audit.backend = Utils::to_lower_copy(value);
      else if (key == Keys::AUDIT_FILE_PATH)
        audit.file_path = value;
      else if (key == Keys::AUDIT_MONGO_URI)
        audit.mongo_uri = value;
      else if (key == Keys::AUDIT_MONGO_DATABASE)
        audit.mongo_database = value;
      else if (key == Keys::AUDIT_MONGO_COLLECTION)
        audit.mongo_collection = value;
      else if (key == Keys::AUDIT_MAX_ENTRIES_PER_GUILD)
        assign_number(audit.max_entries_per_guild, key, value, line_num);
      else if (key == Keys::AUDIT_LOG_NONE_DECISIONS)
        audit.log_none_decisions = string_to_bool(value);

    } else if (current_section == "Ingest") {
      if (key == Keys::INGEST_SOURCE_PATH)
        config.ingest.source_path = value;
      else if (key == Keys::INGEST_FOLLOW)
        config.ingest.follow = string_to_bool(value);
      else if (key == Keys::INGEST_POLL_INTERVAL_MS)
        assign_number(config.ingest.poll_interval_ms, key, value, line_num);

    } else if (current_section == "Monitoring") {
      if (key == Keys::MONITORING_WEB_SERVER_ENABLED)
        config.monitoring.web_server_enabled = string_to_bool(value);
      else if (key == Keys::MONITORING_WEB_SERVER_HOST)
        config.monitoring.web_server_host = value;
      else if (key == Keys::MONITORING_WEB_SERVER_PORT)
        assign_number(config.monitoring.web_server_port, key, value, line_num);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "rules.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map)
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
        }
      }
    }
  }

  if (auto token = Utils::get_env(Keys::ENV_BOT_TOKEN))
    config.executor.bot_token = *token;

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  std::lock_guard<std::mutex> writer_lock(update_mutex_);
  return load_locked(filepath);
}

bool ConfigManager::reload() {
  std::lock_guard<std::mutex> writer_lock(update_mutex_);
  if (config_filepath_.empty())
    return false;
  return load_locked(config_filepath_);
}

bool ConfigManager::load_locked(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  for (const auto &entry : runtime_guilds_) {
    if (entry.second)
      new_config->guilds[entry.first] = *entry.second;
    else
      new_config->guilds.erase(entry.first);
  }

  return apply_locked(new_config);
}

bool ConfigManager::apply(std::shared_ptr<const AppConfig> new_config) {
  std::lock_guard<std::mutex> writer_lock(update_mutex_);
  return apply_locked(std::move(new_config));
}

bool ConfigManager::apply_locked(std::shared_ptr<const AppConfig> new_config) {
  if (!new_config)
    return false;

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = std::move(new_config);
  return true;
}

bool ConfigManager::update_guild(uint64_t guild_id,
                                 const GuildConfig &guild_config) {
  // Copy on write: evaluations holding the previous snapshot are unaffected
  std::lock_guard<std::mutex> writer_lock(update_mutex_);
  auto updated = std::make_shared<AppConfig>(*get_config());
  updated->guilds[guild_id] = guild_config;
  if (!apply_locked(updated))
    return false;

  runtime_guilds_[guild_id] = guild_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Guild " << guild_id << " configuration updated (sensitivity="
               << sensitivity_to_string(guild_config.sensitivity) << ")");
  return true;
}

bool ConfigManager::remove_guild(uint64_t guild_id) {
  std::lock_guard<std::mutex> writer_lock(update_mutex_);
  auto updated = std::make_shared<AppConfig>(*get_config());
  if (updated->guilds.erase(guild_id) == 0)
    return false;
  if (!apply_locked(updated))
    return false;
  runtime_guilds_[guild_id] = std::nullopt;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
