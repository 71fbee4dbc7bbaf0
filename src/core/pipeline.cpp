#include "pipeline.hpp"
#include "logger.hpp"
#include "metrics_manager.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace {

LabeledCounter *dropped_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_events_dropped_total", "Message events dropped, by reason.");
  return counter;
}

} // namespace

ModerationPipeline::ModerationPipeline(
    Config::ConfigManager &config_manager,
    std::shared_ptr<ActionExecutor> executor,
    std::shared_ptr<AuditLogger> audit_logger)
    : ModerationPipeline(config_manager, std::move(executor),
                         std::move(audit_logger),
                         DecisionEngine::default_evaluators()) {}

ModerationPipeline::ModerationPipeline(
    Config::ConfigManager &config_manager,
    std::shared_ptr<ActionExecutor> executor,
    std::shared_ptr<AuditLogger> audit_logger,
    std::vector<std::unique_ptr<IRuleEvaluator>> evaluators)
    : config_manager_(config_manager), executor_(std::move(executor)),
      audit_logger_(std::move(audit_logger)),
      window_store_(
          config_manager.get_config()->engine.window_duration_seconds * 1000,
          config_manager.get_config()->engine.window_max_messages,
          config_manager.get_config()->engine.shard_count,
          config_manager.get_config()->rules.fingerprint_max_length),
      offense_store_(config_manager.get_config()->engine.shard_count),
      decision_engine_(offense_store_, std::move(evaluators)) {
  auto config = config_manager_.get_config();
  const size_t worker_count = std::max<size_t>(1, config->engine.worker_threads);
  for (size_t i = 0; i < worker_count; ++i)
    workers_.push_back(
        std::make_unique<Worker>(config->engine.worker_queue_capacity));
}

ModerationPipeline::~ModerationPipeline() { stop(); }

void ModerationPipeline::start() {
  if (running_.exchange(true))
    return;
  for (auto &worker : workers_) {
    Worker *raw = worker.get();
    worker->thread = std::thread([this, raw] { worker_loop(*raw); });
  }
  LOG(LogLevel::INFO, LogComponent::CORE,
      "ModerationPipeline started with " << workers_.size()
                                         << " evaluation workers.");
}

void ModerationPipeline::stop() {
  for (auto &worker : workers_)
    worker->queue.shutdown();
  for (auto &worker : workers_)
    if (worker->thread.joinable())
      worker->thread.join();
  if (running_.exchange(false))
    LOG(LogLevel::INFO, LogComponent::CORE,
        "ModerationPipeline stopped. Processed " << processed_.load()
                                                 << " events.");
}

bool ModerationPipeline::submit(const MessageEvent &event) {
  static LabeledCounter *received_counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_events_received_total", "Message events offered to the engine.");
  received_counter->increment();
  ++received_;

  GuildUserKey key{event.guild_id, event.author_id};
  Worker &worker = *workers_[GuildUserKeyHash{}(key) % workers_.size()];
  if (worker.queue.try_push(event))
    return true;

  ++dropped_;
  dropped_counter()->increment({{"reason", "queue_full"}});
  LOG(LogLevel::WARN, LogComponent::CORE,
      "Evaluation queue full, dropping message " << event.message_id
                                                 << " for " << key.to_string());
  return false;
}

void ModerationPipeline::handle(const IngestEvent &event) {
  switch (event.type) {
  case IngestEventType::MESSAGE_CREATE:
    submit(event.message);
    break;
  case IngestEventType::MESSAGE_DELETE:
    cancel(event.deleted_message_id);
    break;
  }
}

void ModerationPipeline::cancel(uint64_t message_id) {
  std::lock_guard<std::mutex> lock(cancel_mutex_);
  if (!cancelled_ids_.insert(message_id).second)
    return;
  cancelled_order_.push_back(message_id);
  // Retractions for messages that were already evaluated never get consumed
  while (cancelled_order_.size() > MAX_PENDING_CANCELLATIONS) {
    cancelled_ids_.erase(cancelled_order_.front());
    cancelled_order_.pop_front();
  }
  pending_cancellations_ = cancelled_ids_.size();
}

bool ModerationPipeline::consume_cancellation(uint64_t message_id) {
  if (pending_cancellations_.load() == 0)
    return false;
  std::lock_guard<std::mutex> lock(cancel_mutex_);
  if (cancelled_ids_.erase(message_id) == 0)
    return false;
  cancelled_order_.erase(std::remove(cancelled_order_.begin(),
                                     cancelled_order_.end(), message_id),
                         cancelled_order_.end());
  pending_cancellations_ = cancelled_ids_.size();
  return true;
}

bool ModerationPipeline::is_quarantined(const GuildUserKey &key) const {
  if (quarantined_count_.load() == 0)
    return false;
  std::shared_lock<std::shared_mutex> lock(quarantine_mutex_);
  return quarantined_.count(key) > 0;
}

void ModerationPipeline::quarantine(const GuildUserKey &key,
                                    const std::string &reason) {
  static LabeledCounter *faults_counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_partition_faults_total",
          "Internal invariant violations, each quarantining one partition.");
  static Gauge *quarantined_gauge = MetricsManager::instance().register_gauge(
      "gw_quarantined_partitions", "Partitions currently quarantined.");

  ++partition_faults_;
  faults_counter->increment();
  {
    std::unique_lock<std::shared_mutex> lock(quarantine_mutex_);
    quarantined_.insert(key);
    quarantined_count_ = quarantined_.size();
  }
  quarantined_gauge->set(static_cast<double>(quarantined_count_.load()));
  LOG(LogLevel::ERROR, LogComponent::CORE,
      "Quarantined partition " << key.to_string() << ": " << reason);
}

void ModerationPipeline::reset_partition(const GuildUserKey &key) {
  window_store_.reset(key);
  {
    std::unique_lock<std::shared_mutex> lock(quarantine_mutex_);
    quarantined_.erase(key);
    quarantined_count_ = quarantined_.size();
  }
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Partition " << key.to_string() << " reset.");
}

std::optional<Decision>
ModerationPipeline::process(const MessageEvent &event, bool execute_inline) {
  static LabeledCounter *cancelled_counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_events_cancelled_total",
          "Events skipped because the message was retracted first.");

  if (consume_cancellation(event.message_id)) {
    ++cancelled_;
    cancelled_counter->increment();
    LOG(LogLevel::DEBUG, LogComponent::CORE,
        "Skipping retracted message " << event.message_id);
    return std::nullopt;
  }

  GuildUserKey key{event.guild_id, event.author_id};
  if (is_quarantined(key)) {
    ++dropped_;
    dropped_counter()->increment({{"reason", "quarantined"}});
    return std::nullopt;
  }

  // One configuration snapshot per event
  auto config = config_manager_.get_config();
  window_store_.reconfigure(config->engine.window_duration_seconds * 1000,
                            config->engine.window_max_messages,
                            config->rules.fingerprint_max_length);

  Decision decision;
  try {
    WindowSnapshot snapshot = window_store_.record(event);
    snapshot.validate(config->engine.window_max_messages);
    decision = decision_engine_.evaluate(snapshot, *config);
    decision_engine_.commit(decision, event.received_at_ms);
  } catch (const PartitionFault &fault) {
    quarantine(fault.key(), fault.what());
    return std::nullopt;
  }
  ++processed_;

  if (!decision.is_actionable()) {
    decision.stage = DecisionStage::TERMINAL;
    finalize(decision);
    return decision;
  }

  if (execute_inline || !executor_) {
    if (executor_) {
      decision.outcome = executor_->execute(decision);
    } else {
      ActionOutcome outcome;
      outcome.error = "no action executor";
      outcome.completed_at_ms = decision.decided_at_ms;
      decision.outcome = outcome;
    }
    decision.stage = DecisionStage::TERMINAL;
    finalize(decision);
    return decision;
  }

  auto audit_logger = audit_logger_;
  bool queued = executor_->submit(decision, [audit_logger](Decision done) {
    if (audit_logger)
      audit_logger->record_decision(done);
  });
  if (!queued) {
    ActionOutcome outcome;
    outcome.error = "action queue unavailable";
    outcome.completed_at_ms = Utils::get_current_time_ms();
    decision.outcome = outcome;
    decision.stage = DecisionStage::TERMINAL;
    finalize(decision);
  }
  return decision;
}

void ModerationPipeline::finalize(Decision decision) {
  if (audit_logger_)
    audit_logger_->record_decision(decision);
}

std::optional<Decision>
ModerationPipeline::process_now(const MessageEvent &event) {
  return process(event, true);
}

void ModerationPipeline::worker_loop(Worker &worker) {
  MessageEvent event;
  while (worker.queue.wait_and_pop(event)) {
    try {
      process(event, false);
    } catch (const std::exception &e) {
      ++dropped_;
      dropped_counter()->increment({{"reason", "error"}});
      LOG(LogLevel::ERROR, LogComponent::CORE,
          "Failed to process message " << event.message_id << ": "
                                       << e.what());
    }
  }
}

size_t ModerationPipeline::sweep(uint64_t now_ms) {
  auto config = config_manager_.get_config();
  size_t removed = window_store_.evict_expired(now_ms);
  offense_store_.evict_expired(
      now_ms, config->escalation.escalation_window_seconds * 1000);
  return removed;
}

PipelineStats ModerationPipeline::stats() const {
  PipelineStats stats;
  stats.received = received_.load();
  stats.processed = processed_.load();
  stats.dropped = dropped_.load();
  stats.cancelled = cancelled_.load();
  stats.partition_faults = partition_faults_.load();
  stats.quarantined_partitions = quarantined_count_.load();
  stats.active_windows = window_store_.window_count();
  return stats;
}
