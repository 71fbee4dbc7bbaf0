#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "analysis/window_store.hpp"
#include "audit_logger.hpp"
#include "config.hpp"
#include "decision.hpp"
#include "detection/decision_engine.hpp"
#include "detection/offense_store.hpp"
#include "enforcement/action_executor.hpp"
#include "message_event.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

struct PipelineStats {
  uint64_t received = 0;
  uint64_t processed = 0;
  uint64_t dropped = 0;
  uint64_t cancelled = 0;
  uint64_t partition_faults = 0;
  size_t quarantined_partitions = 0;
  size_t active_windows = 0;
};

// Routes events to evaluation workers by (guild, user), so events for one
// key are always handled in order by the same worker. Each worker owns a
// bounded queue; a full queue drops the event rather than blocking intake.
class ModerationPipeline {
public:
  ModerationPipeline(Config::ConfigManager &config_manager,
                     std::shared_ptr<ActionExecutor> executor,
                     std::shared_ptr<AuditLogger> audit_logger);
  ModerationPipeline(Config::ConfigManager &config_manager,
                     std::shared_ptr<ActionExecutor> executor,
                     std::shared_ptr<AuditLogger> audit_logger,
                     std::vector<std::unique_ptr<IRuleEvaluator>> evaluators);
  ~ModerationPipeline();

  ModerationPipeline(const ModerationPipeline &) = delete;
  ModerationPipeline &operator=(const ModerationPipeline &) = delete;

  void start();
  // Evaluates everything already queued, then joins the workers
  void stop();

  // False when the event was dropped
  bool submit(const MessageEvent &event);
  void handle(const IngestEvent &event);

  // Best effort: an event not yet evaluated is skipped, one already in
  // evaluation completes normally
  void cancel(uint64_t message_id);

  // Evaluates and executes on the calling thread. nullopt when the event was
  // skipped (cancelled, quarantined or faulted).
  std::optional<Decision> process_now(const MessageEvent &event);

  // Evicts idle windows and expired offense records
  size_t sweep(uint64_t now_ms);

  bool is_quarantined(const GuildUserKey &key) const;
  void reset_partition(const GuildUserKey &key);

  PipelineStats stats() const;

  WindowStore &window_store() { return window_store_; }
  OffenseStore &offense_store() { return offense_store_; }

private:
  struct Worker {
    explicit Worker(size_t capacity) : queue(capacity) {}
    ThreadSafeQueue<MessageEvent> queue;
    std::thread thread;
  };

  std::optional<Decision> process(const MessageEvent &event,
                                  bool execute_inline);
  void finalize(Decision decision);
  void worker_loop(Worker &worker);
  bool consume_cancellation(uint64_t message_id);
  void quarantine(const GuildUserKey &key, const std::string &reason);

  Config::ConfigManager &config_manager_;
  std::shared_ptr<ActionExecutor> executor_;
  std::shared_ptr<AuditLogger> audit_logger_;

  WindowStore window_store_;
  OffenseStore offense_store_;
  DecisionEngine decision_engine_;

  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> running_{false};

  std::mutex cancel_mutex_;
  std::unordered_set<uint64_t> cancelled_ids_;
  std::deque<uint64_t> cancelled_order_;
  std::atomic<size_t> pending_cancellations_{0};

  mutable std::shared_mutex quarantine_mutex_;
  std::unordered_set<GuildUserKey, GuildUserKeyHash> quarantined_;
  std::atomic<size_t> quarantined_count_{0};

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> cancelled_{0};
  std::atomic<uint64_t> partition_faults_{0};

  static constexpr size_t MAX_PENDING_CANCELLATIONS = 10000;
};

#endif // PIPELINE_HPP
