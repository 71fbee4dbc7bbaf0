#ifndef ACTION_EXECUTOR_HPP
#define ACTION_EXECUTOR_HPP

#include "core/config.hpp"
#include "core/decision.hpp"
#include "enforcement/retry_policy.hpp"
#include "io/moderation/base_moderation_client.hpp"
#include "utils/circuit_breaker.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Receives the decision with its outcome attached and stage TERMINAL
using ActionCallback = std::function<void(Decision)>;

// Turns actionable decisions into moderation API calls. Each call goes
// through the endpoint's circuit breaker and the retry policy; the call
// sequence for one decision stops at the first call that finally fails.
class ActionExecutor {
public:
  ActionExecutor(std::shared_ptr<IModerationClient> client,
                 const Config::AppConfig &config,
                 circuit_breaker::CircuitBreakerRegistry &breakers =
                     circuit_breaker::CircuitBreakerRegistry::instance());
  ~ActionExecutor();

  ActionExecutor(const ActionExecutor &) = delete;
  ActionExecutor &operator=(const ActionExecutor &) = delete;

  void start();
  // Finishes queued work; pending backoff waits end and fail their call
  void stop();

  // False when the queue is full or the executor is stopping; the callback
  // is not invoked in that case
  bool submit(Decision decision, ActionCallback on_complete);

  // Runs the call sequence on the calling thread
  ActionOutcome execute(const Decision &decision);

  void reconfigure(const Config::AppConfig &config);

  static std::vector<ApiCallKind>
  plan_calls(const Decision &decision,
             const Config::EscalationConfig &escalation);

private:
  struct Job {
    Decision decision;
    ActionCallback on_complete;
  };

  void worker_loop();
  CallOutcome perform_call(ApiCallKind kind, const Decision &decision);
  ApiResult invoke(ApiCallKind kind, const Decision &decision);
  bool wait_for(std::chrono::milliseconds delay);
  std::shared_ptr<circuit_breaker::CircuitBreaker> breaker_for(ApiCallKind kind);

  std::shared_ptr<IModerationClient> client_;
  circuit_breaker::CircuitBreakerRegistry &breakers_;
  RetryPolicy retry_policy_;

  mutable std::mutex config_mutex_;
  Config::EscalationConfig escalation_;
  Config::CircuitBreakerConfig breaker_config_;
  bool dry_run_;

  size_t worker_count_;
  ThreadSafeQueue<Job> queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};

  std::mutex sleep_mutex_;
  std::condition_variable sleep_cv_;
};

#endif // ACTION_EXECUTOR_HPP
