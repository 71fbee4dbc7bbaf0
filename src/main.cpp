#include "core/audit_logger.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "core/metrics_registry.hpp"
#include "core/pipeline.hpp"
#include "enforcement/action_executor.hpp"
#include "io/audit/file_audit_store.hpp"
#include "io/audit/mongo_audit_store.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/event_readers/jsonl_event_reader.hpp"
#include "io/moderation/http_moderation_client.hpp"
#include "io/web/web_server.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_config_requested = true;
}

// --- Ingestion thread function ---
void ingest_thread(IEventReader &reader, ModerationPipeline &pipeline,
                   uint64_t poll_interval_ms) {
  static RateMeter *events_ingested =
      MetricsManager::instance().register_rate_meter(
          "gw_events_ingested", "Ingested events per trailing window.");

  LOG(LogLevel::INFO, LogComponent::IO_INGEST, "Ingest thread started.");
  while (!g_shutdown_requested) {
    std::vector<IngestEvent> batch = reader.get_next_batch();
    for (const auto &event : batch)
      pipeline.handle(event);
    if (!batch.empty())
      events_ingested->mark(batch.size());

    if (batch.empty()) {
      if (reader.is_finished())
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));
    }
  }
  LOG(LogLevel::INFO, LogComponent::IO_INGEST, "Ingest thread shutting down.");
}

std::unique_ptr<IAuditStore> create_audit_store(const Config::AuditConfig &audit) {
  if (audit.backend == "mongodb") {
    auto mongo_manager = std::make_shared<MongoManager>(audit.mongo_uri);
    if (mongo_manager->is_initialized() && mongo_manager->ping())
      return std::make_unique<MongoAuditStore>(
          mongo_manager, audit.mongo_database, audit.mongo_collection);
    LOG(LogLevel::ERROR, LogComponent::IO_AUDIT,
        "MongoDB audit backend unavailable, falling back to file "
            << audit.file_path);
  }
  return std::make_unique<FileAuditStore>(audit.file_path);
}

void apply_runtime_config(const Config::AppConfig &config,
                          ActionExecutor &executor, AuditLogger &audit_logger) {
  LogManager::instance().configure(config.logging);
  executor.reconfigure(config);
  audit_logger.reconfigure(config.audit);
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  // Register all signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Running with default settings." << std::endl;

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "guild_warden starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  // --- Audit ---
  auto audit_logger = std::make_shared<AuditLogger>(
      create_audit_store(current_config->audit), current_config->audit);
  audit_logger->initialize();

  // --- Enforcement ---
  auto moderation_client =
      std::make_shared<HttpModerationClient>(current_config->executor);
  if (!moderation_client->is_valid() && !current_config->executor.dry_run) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Moderation API client could not be configured. Exiting.");
    return 1;
  }
  auto executor =
      std::make_shared<ActionExecutor>(moderation_client, *current_config);
  executor->start();

  // --- Pipeline ---
  ModerationPipeline pipeline(config_manager, executor, audit_logger);
  pipeline.start();

  // --- Event Source ---
  std::unique_ptr<IEventReader> reader;
  try {
    reader = std::make_unique<JsonLinesEventReader>(
        current_config->ingest.source_path, current_config->ingest.follow);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to open event source: " << e.what());
    pipeline.stop();
    executor->stop();
    return 1;
  }

  // --- Web Server ---
  std::unique_ptr<WebServer> web_server;
  if (current_config->monitoring.web_server_enabled) {
    web_server = std::make_unique<WebServer>(
        current_config->monitoring.web_server_host,
        current_config->monitoring.web_server_port, MetricsRegistry::instance(),
        *audit_logger, pipeline, config_manager);
    web_server->start();
  }

  std::thread reader_thread(ingest_thread, std::ref(*reader),
                            std::ref(pipeline),
                            current_config->ingest.poll_interval_ms);

  // --- Main loop: reloads and periodic sweeps ---
  auto last_sweep = std::chrono::steady_clock::now();
  bool source_finished = false;
  while (!g_shutdown_requested) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CONFIG,
          "SIGHUP received, reloading " << config_file_to_load);
      if (config_manager.reload()) {
        apply_runtime_config(*config_manager.get_config(), *executor,
                             *audit_logger);
        LOG(LogLevel::INFO, LogComponent::CONFIG, "Configuration reloaded.");
      } else {
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Configuration reload failed; previous settings remain active.");
      }
    }

    auto sweep_interval = std::chrono::seconds(
        config_manager.get_config()->engine.sweep_interval_seconds);
    if (std::chrono::steady_clock::now() - last_sweep >= sweep_interval) {
      size_t removed = pipeline.sweep(Utils::get_current_time_ms());
      LOG(LogLevel::DEBUG, LogComponent::CORE,
          "Sweep removed " << removed << " idle windows.");
      last_sweep = std::chrono::steady_clock::now();
    }

    if (!source_finished && reader->is_finished()) {
      source_finished = true;
      LOG(LogLevel::INFO, LogComponent::CORE,
          "Event source exhausted."
              << (web_server ? " Serving admin endpoints until stopped."
                             : " Shutting down."));
      if (!web_server)
        break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // --- Graceful Shutdown ---
  LOG(LogLevel::INFO, LogComponent::CORE, "Shutting down...");
  g_shutdown_requested = true;
  if (reader_thread.joinable())
    reader_thread.join();
  pipeline.stop();
  executor->stop();
  if (web_server)
    web_server->stop();

  PipelineStats stats = pipeline.stats();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Shutdown complete. Received " << stats.received << ", processed "
                                     << stats.processed << ", dropped "
                                     << stats.dropped << ".");
  return 0;
}
