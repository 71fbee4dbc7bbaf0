#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/audit_logger.hpp"
#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "core/pipeline.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Admin and monitoring endpoints:
//   GET  /metrics                      Prometheus text
//   GET  /health                       circuit states and pipeline counters
//   GET  /api/v1/metrics               metrics as JSON
//   GET  /api/v1/audit?guild_id=...    audit query, newest first
//   POST /api/v1/audit/manual          record a moderator action
//   PUT  /api/v1/guilds/<id>/config    replace one guild's overrides
class WebServer {
public:
  WebServer(const std::string &host, int port,
            MetricsRegistry &metrics_registry, AuditLogger &audit_logger,
            ModerationPipeline &pipeline,
            Config::ConfigManager &config_manager);
  ~WebServer();

  void start();
  void stop();

private:
  void register_routes();
  void run();
  void monitor_process();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::thread monitor_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::string host_;
  int port_;
  MetricsRegistry &metrics_registry_;
  AuditLogger &audit_logger_;
  ModerationPipeline &pipeline_;
  Config::ConfigManager &config_manager_;
};

// Builds a guild override from a JSON object; nullopt on an invalid field
std::optional<Config::GuildConfig>
guild_config_from_json(const nlohmann::json &j, std::string &error);

#endif // WEB_SERVER_HPP
