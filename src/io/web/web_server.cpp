#include "web_server.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/circuit_breaker.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>

namespace {

constexpr size_t DEFAULT_AUDIT_LIMIT = 50;
constexpr size_t MAX_AUDIT_LIMIT = 1000;

void send_error(httplib::Response &res, int status, const std::string &message) {
  res.status = status;
  res.set_content(nlohmann::json{{"error", message}}.dump(),
                  "application/json");
}

std::optional<uint64_t> query_u64(const httplib::Request &req,
                                  const char *name) {
  if (!req.has_param(name))
    return std::nullopt;
  return Utils::string_to_number<uint64_t>(req.get_param_value(name));
}

std::optional<uint64_t> json_u64(const nlohmann::json &j, const char *field) {
  auto it = j.find(field);
  if (it == j.end())
    return std::nullopt;
  if (it->is_number_unsigned())
    return it->get<uint64_t>();
  if (it->is_string())
    return Utils::string_to_number<uint64_t>(it->get<std::string>());
  return std::nullopt;
}

} // namespace

std::optional<Config::GuildConfig>
guild_config_from_json(const nlohmann::json &j, std::string &error) {
  if (!j.is_object()) {
    error = "body must be a JSON object";
    return std::nullopt;
  }

  Config::GuildConfig guild;
  try {
    if (j.contains("sensitivity")) {
      auto level =
          Config::parse_sensitivity(j.at("sensitivity").get<std::string>());
      if (!level) {
        error = "sensitivity must be low, medium or high";
        return std::nullopt;
      }
      guild.sensitivity = *level;
    }
    if (j.contains("mute_duration_seconds"))
      guild.mute_duration_seconds =
          j.at("mute_duration_seconds").get<uint64_t>();
    if (j.contains("rate_enabled"))
      guild.rate_enabled = j.at("rate_enabled").get<bool>();
    if (j.contains("duplicate_enabled"))
      guild.duplicate_enabled = j.at("duplicate_enabled").get<bool>();
    if (j.contains("link_enabled"))
      guild.link_enabled = j.at("link_enabled").get<bool>();
    if (j.contains("account_risk_enabled"))
      guild.account_risk_enabled = j.at("account_risk_enabled").get<bool>();
    if (j.contains("spam_enabled"))
      guild.spam_enabled = j.at("spam_enabled").get<bool>();
    if (j.contains("rate_threshold"))
      guild.rate_threshold = j.at("rate_threshold").get<size_t>();
    if (j.contains("duplicate_similarity"))
      guild.duplicate_similarity = j.at("duplicate_similarity").get<double>();
    if (j.contains("duplicate_min_consecutive"))
      guild.duplicate_min_consecutive =
          j.at("duplicate_min_consecutive").get<size_t>();
    if (j.contains("warn_threshold"))
      guild.warn_threshold = j.at("warn_threshold").get<double>();
    if (j.contains("mute_threshold"))
      guild.mute_threshold = j.at("mute_threshold").get<double>();
  } catch (const nlohmann::json::exception &e) {
    error = e.what();
    return std::nullopt;
  }
  return guild;
}

WebServer::WebServer(const std::string &host, int port,
                     MetricsRegistry &metrics_registry,
                     AuditLogger &audit_logger, ModerationPipeline &pipeline,
                     Config::ConfigManager &config_manager)
    : host_(host), port_(port), metrics_registry_(metrics_registry),
      audit_logger_(audit_logger), pipeline_(pipeline),
      config_manager_(config_manager) {
  server_ = std::make_unique<httplib::Server>();
  register_routes();
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::register_routes() {
  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "WebServer: Received request for /metrics from " << req.remote_addr);
    res.set_content(MetricsManager::instance().expose_as_prometheus_text() +
                        metrics_registry_.serialize(),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [this](const httplib::Request &,
                                 httplib::Response &res) {
    nlohmann::json j;
    nlohmann::json circuits = nlohmann::json::object();
    bool degraded = false;
    for (const auto &[endpoint, state] :
         circuit_breaker::CircuitBreakerRegistry::instance().snapshot_states()) {
      circuits[endpoint] = circuit_breaker::state_to_string(state);
      degraded = degraded || state != circuit_breaker::State::CLOSED;
    }
    PipelineStats stats = pipeline_.stats();
    j["status"] = degraded ? "degraded" : "ok";
    j["circuits"] = circuits;
    j["pipeline"] = {{"received", stats.received},
                     {"processed", stats.processed},
                     {"dropped", stats.dropped},
                     {"cancelled", stats.cancelled},
                     {"partition_faults", stats.partition_faults},
                     {"quarantined_partitions", stats.quarantined_partitions},
                     {"active_windows", stats.active_windows}};
    res.set_content(j.dump(2), "application/json");
  });

  server_->Get("/api/v1/metrics",
               [](const httplib::Request &, httplib::Response &res) {
                 res.set_content(MetricsManager::instance().expose_as_json(),
                                 "application/json");
               });

  server_->Get("/api/v1/audit", [this](const httplib::Request &req,
                                       httplib::Response &res) {
    auto guild_id = query_u64(req, "guild_id");
    if (!guild_id) {
      send_error(res, 400, "guild_id is required");
      return;
    }

    AuditQueryFilter filter;
    if (req.has_param("user_id")) {
      filter.user_id = query_u64(req, "user_id");
      if (!filter.user_id) {
        send_error(res, 400, "user_id must be a decimal id");
        return;
      }
    }
    if (req.has_param("action")) {
      filter.action = parse_action_type(req.get_param_value("action"));
      if (!filter.action) {
        send_error(res, 400, "action must be none, warn or mute");
        return;
      }
    }
    if (req.has_param("since"))
      filter.since_ms = query_u64(req, "since");

    size_t limit = query_u64(req, "limit").value_or(DEFAULT_AUDIT_LIMIT);
    limit = std::min(limit, MAX_AUDIT_LIMIT);

    nlohmann::json entries = nlohmann::json::array();
    for (const auto &entry : audit_logger_.query(*guild_id, filter, limit))
      entries.push_back(JsonFormatter::audit_entry_to_json_object(entry));
    res.set_content(JsonFormatter::dump_safe(entries, 2), "application/json");
  });

  server_->Post("/api/v1/audit/manual", [this](const httplib::Request &req,
                                               httplib::Response &res) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
      send_error(res, 400, "body must be a JSON object");
      return;
    }
    auto guild_id = json_u64(body, "guild_id");
    auto user_id = json_u64(body, "user_id");
    auto moderator_id = json_u64(body, "moderator_id");
    auto action = parse_action_type(body.value("action", std::string{}));
    if (!guild_id || !user_id || !moderator_id || !action) {
      send_error(res, 400,
                 "guild_id, user_id, moderator_id and action are required");
      return;
    }

    AuditLogEntry entry = audit_logger_.record_manual_action(
        *guild_id, *user_id, *moderator_id, *action,
        json_u64(body, "duration_seconds").value_or(0),
        body.value("reason", std::string{}));
    res.status = 201;
    res.set_content(
        JsonFormatter::dump_safe(JsonFormatter::audit_entry_to_json_object(entry)),
        "application/json");
  });

  server_->Put(R"(/api/v1/guilds/(\d+)/config)",
               [this](const httplib::Request &req, httplib::Response &res) {
                 auto guild_id =
                     Utils::string_to_number<uint64_t>(req.matches[1].str());
                 auto body = nlohmann::json::parse(req.body, nullptr, false);
                 std::string error;
                 auto guild = guild_id && !body.is_discarded()
                                  ? guild_config_from_json(body, error)
                                  : std::nullopt;
                 if (!guild) {
                   send_error(res, 400,
                              error.empty() ? "invalid request" : error);
                   return;
                 }
                 if (!config_manager_.update_guild(*guild_id, *guild)) {
                   send_error(res, 422, "guild configuration rejected");
                   return;
                 }
                 res.status = 204;
               });
}

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  shutdown_flag_ = false;
  server_thread_ = std::thread(&WebServer::run, this);
  monitor_thread_ = std::thread(&WebServer::monitor_process, this);
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();
  if (server_thread_.joinable())
    server_thread_.join();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
    LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped.");
  }
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen(host_.c_str(), port_))
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Web server failed to listen on " << host_ << ":" << port_);
}

void WebServer::monitor_process() {
  while (!shutdown_flag_) {
    metrics_registry_.sample_process_memory();
    for (const auto &[endpoint, state] :
         circuit_breaker::CircuitBreakerRegistry::instance().snapshot_states())
      metrics_registry_.set_circuit_state(endpoint, state);
    metrics_registry_.set_active_windows(pipeline_.stats().active_windows);

    for (int i = 0; i < 150 && !shutdown_flag_; ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}
