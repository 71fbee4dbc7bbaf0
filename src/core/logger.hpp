#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // IO sub-components
  IO_INGEST,
  IO_API,
  IO_AUDIT,
  IO_DATABASE,
  IO_WEB,

  // Window store
  WINDOW,

  // Rules sub-components
  RULES_EVAL,
  RULES_RATE,
  RULES_DUPLICATE,
  RULES_LINK,
  RULES_ACCOUNT,
  RULES_SPAM,

  // Decision and enforcement
  DECISION,
  ESCALATION,
  EXECUTOR,
  CIRCUIT
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

private:
  LogManager() = default; // Private constructor for singleton
  mutable std::mutex mutex_;
  std::map<LogComponent, LogLevel> log_levels_;
};

// Arguments are only evaluated when the level is enabled for the component
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm tm_buf{};                                                        \
      gmtime_r(&time_t_now, &tm_buf);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      std::cout << oss.str() << std::endl;                                     \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::IO_INGEST:
    return "IO.INGEST";
  case LogComponent::IO_API:
    return "IO.API";
  case LogComponent::IO_AUDIT:
    return "IO.AUDIT";
  case LogComponent::IO_DATABASE:
    return "IO.DATABASE";
  case LogComponent::IO_WEB:
    return "IO.WEB";
  case LogComponent::WINDOW:
    return "WINDOW";
  case LogComponent::RULES_EVAL:
    return "RULES.EVAL";
  case LogComponent::RULES_RATE:
    return "RULES.RATE";
  case LogComponent::RULES_DUPLICATE:
    return "RULES.DUPLICATE";
  case LogComponent::RULES_LINK:
    return "RULES.LINK";
  case LogComponent::RULES_ACCOUNT:
    return "RULES.ACCOUNT";
  case LogComponent::RULES_SPAM:
    return "RULES.SPAM";
  case LogComponent::DECISION:
    return "DECISION";
  case LogComponent::ESCALATION:
    return "ESCALATION";
  case LogComponent::EXECUTOR:
    return "EXECUTOR";
  case LogComponent::CIRCUIT:
    return "CIRCUIT";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
