#include "action_executor.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace {

LabeledCounter *api_calls_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_api_calls_total",
          "Moderation API attempts by endpoint and result.");
  return counter;
}

LabeledCounter *circuit_rejections_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_circuit_rejections_total",
          "Calls rejected because the endpoint's circuit was open.");
  return counter;
}

LabeledCounter *actions_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_actions_total", "Executed moderation actions by outcome.");
  return counter;
}

} // namespace

ActionExecutor::ActionExecutor(
    std::shared_ptr<IModerationClient> client,
    const Config::AppConfig &config,
    circuit_breaker::CircuitBreakerRegistry &breakers)
    : client_(std::move(client)), breakers_(breakers),
      retry_policy_(config.executor), escalation_(config.escalation),
      breaker_config_(config.circuit_breaker),
      dry_run_(config.executor.dry_run),
      worker_count_(std::max<size_t>(1, config.executor.worker_threads)),
      queue_(config.executor.queue_capacity) {}

ActionExecutor::~ActionExecutor() { stop(); }

void ActionExecutor::start() {
  if (running_.exchange(true))
    return;
  for (size_t i = 0; i < worker_count_; ++i)
    workers_.emplace_back(&ActionExecutor::worker_loop, this);
  LOG(LogLevel::INFO, LogComponent::EXECUTOR,
      "ActionExecutor started with " << worker_count_ << " workers"
                                     << (dry_run_ ? " (dry run)" : ""));
}

void ActionExecutor::stop() {
  {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    stopping_ = true;
  }
  sleep_cv_.notify_all();
  queue_.shutdown();

  for (auto &worker : workers_)
    if (worker.joinable())
      worker.join();
  workers_.clear();

  if (running_.exchange(false))
    LOG(LogLevel::INFO, LogComponent::EXECUTOR, "ActionExecutor stopped.");
}

void ActionExecutor::reconfigure(const Config::AppConfig &config) {
  retry_policy_.reconfigure(config.executor);
  std::lock_guard<std::mutex> lock(config_mutex_);
  escalation_ = config.escalation;
  breaker_config_ = config.circuit_breaker;
  dry_run_ = config.executor.dry_run;
}

bool ActionExecutor::submit(Decision decision, ActionCallback on_complete) {
  if (stopping_)
    return false;
  if (!queue_.try_push(Job{std::move(decision), std::move(on_complete)})) {
    LOG(LogLevel::WARN, LogComponent::EXECUTOR,
        "Action queue full (" << queue_.capacity()
                              << "), rejecting decision.");
    return false;
  }
  return true;
}

void ActionExecutor::worker_loop() {
  Job job;
  while (queue_.wait_and_pop(job)) {
    job.decision.outcome = execute(job.decision);
    job.decision.stage = DecisionStage::TERMINAL;
    if (!job.on_complete)
      continue;
    try {
      job.on_complete(std::move(job.decision));
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::EXECUTOR,
          "Action completion callback failed: " << e.what());
    }
  }
}

std::vector<ApiCallKind>
ActionExecutor::plan_calls(const Decision &decision,
                           const Config::EscalationConfig &escalation) {
  std::vector<ApiCallKind> calls;
  switch (decision.action) {
  case ActionType::MUTE:
    calls.push_back(ApiCallKind::MUTE);
    if (escalation.delete_offending_message)
      calls.push_back(ApiCallKind::DELETE_MESSAGE);
    break;
  case ActionType::WARN:
    if (escalation.delete_unsafe_links &&
        decision.has_rule(RuleId::SUSPICIOUS_LINK))
      calls.push_back(ApiCallKind::DELETE_MESSAGE);
    calls.push_back(ApiCallKind::WARN);
    break;
  case ActionType::NONE:
    break;
  }
  return calls;
}

std::shared_ptr<circuit_breaker::CircuitBreaker>
ActionExecutor::breaker_for(ApiCallKind kind) {
  circuit_breaker::CircuitBreaker::Config config;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config.failure_threshold = breaker_config_.failure_threshold;
    config.timeout =
        std::chrono::milliseconds(breaker_config_.cool_down_seconds * 1000);
  }
  return breakers_.get_or_create(api_call_kind_to_string(kind), config);
}

ApiResult ActionExecutor::invoke(ApiCallKind kind, const Decision &decision) {
  const std::string reason = decision.reason();
  try {
    switch (kind) {
    case ApiCallKind::MUTE:
      return client_->mute(decision.guild_id, decision.user_id,
                           decision.duration_seconds, reason);
    case ApiCallKind::DELETE_MESSAGE:
      return client_->delete_message(decision.guild_id, decision.channel_id,
                                     decision.message_id, reason);
    case ApiCallKind::WARN:
      return client_->warn(decision.guild_id, decision.channel_id,
                           decision.user_id, reason);
    }
  } catch (const std::exception &e) {
    return classify_transport_error(e.what());
  }
  return ApiResult::non_retryable("unknown call kind", 0);
}

bool ActionExecutor::wait_for(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(sleep_mutex_);
  return !sleep_cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
}

CallOutcome ActionExecutor::perform_call(ApiCallKind kind,
                                         const Decision &decision) {
  const std::string endpoint = api_call_kind_to_string(kind);
  auto breaker = breaker_for(kind);
  const size_t max_attempts = retry_policy_.max_attempts();

  CallOutcome outcome;
  outcome.kind = kind;

  for (size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (!breaker->allow_request()) {
      circuit_rejections_counter()->increment({{"endpoint", endpoint}});
      outcome.error = "circuit open for " + endpoint;
      LOG(LogLevel::WARN, LogComponent::EXECUTOR,
          "Skipping " << endpoint << " for user " << decision.user_id
                      << " in guild " << decision.guild_id
                      << ": circuit is " << breaker->get_state_string());
      return outcome;
    }

    ApiResult result = invoke(kind, decision);
    outcome.attempts = attempt;
    outcome.last_status = result.status;
    api_calls_counter()->increment(
        {{"endpoint", endpoint},
         {"result", api_result_kind_to_string(result.kind)}});

    if (result.is_success()) {
      breaker->record_success();
      outcome.success = true;
      outcome.error.clear();
      return outcome;
    }

    outcome.error = result.error;
    if (!result.is_retryable()) {
      // The dependency answered; this is about the request, not its health
      breaker->record_success();
      LOG(LogLevel::ERROR, LogComponent::EXECUTOR,
          endpoint << " for user " << decision.user_id << " in guild "
                   << decision.guild_id << " (message " << decision.message_id
                   << ") failed permanently: " << result.error);
      return outcome;
    }

    breaker->record_failure();
    if (retry_policy_.hint_exceeds_limit(result)) {
      outcome.error += " (retry_after " +
                       std::to_string(result.retry_after->count()) +
                       "ms exceeds limit)";
      LOG(LogLevel::ERROR, LogComponent::EXECUTOR,
          endpoint << " for user " << decision.user_id << " in guild "
                   << decision.guild_id << " not retried: " << outcome.error);
      return outcome;
    }
    if (attempt == max_attempts)
      break;

    auto delay = retry_policy_.next_delay(attempt, result);
    LOG(LogLevel::DEBUG, LogComponent::EXECUTOR,
        endpoint << " attempt " << attempt << " failed (" << result.error
                 << "), retrying in " << delay.count() << "ms");
    if (!wait_for(delay)) {
      outcome.error += " (retry abandoned on shutdown)";
      return outcome;
    }
  }

  LOG(LogLevel::ERROR, LogComponent::EXECUTOR,
      endpoint << " for user " << decision.user_id << " in guild "
               << decision.guild_id << " failed after " << outcome.attempts
               << " attempts: " << outcome.error);
  return outcome;
}

ActionOutcome ActionExecutor::execute(const Decision &decision) {
  ActionOutcome outcome;

  Config::EscalationConfig escalation;
  bool dry_run;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    escalation = escalation_;
    dry_run = dry_run_;
  }

  if (!decision.is_actionable()) {
    outcome.success = true;
    outcome.completed_at_ms = Utils::get_current_time_ms();
    return outcome;
  }

  if (dry_run) {
    LOG(LogLevel::INFO, LogComponent::EXECUTOR,
        "[dry run] " << decision.reason() << " for user " << decision.user_id
                     << " in guild " << decision.guild_id);
    outcome.success = true;
    outcome.completed_at_ms = Utils::get_current_time_ms();
    actions_counter()->increment(
        {{"action", action_type_to_string(decision.action)},
         {"outcome", "dry_run"}});
    return outcome;
  }

  outcome.success = true;
  for (ApiCallKind kind : plan_calls(decision, escalation)) {
    CallOutcome call = perform_call(kind, decision);
    outcome.total_attempts += call.attempts;
    outcome.calls.push_back(call);
    if (!call.success) {
      outcome.success = false;
      outcome.error = std::string(api_call_kind_to_string(kind)) + ": " +
                      call.error;
      break;
    }
  }
  outcome.completed_at_ms = Utils::get_current_time_ms();

  actions_counter()->increment(
      {{"action", action_type_to_string(decision.action)},
       {"outcome", outcome.success ? "success" : "failure"}});
  LOG(LogLevel::INFO, LogComponent::EXECUTOR,
      action_type_to_string(decision.action)
          << " for user " << decision.user_id << " in guild "
          << decision.guild_id << ": "
          << (outcome.success ? "succeeded" : "failed") << " after "
          << outcome.total_attempts << " attempts");
  return outcome;
}
