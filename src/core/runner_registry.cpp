#include "runner_registry.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace inference_gateway {

auto
to_string(RunnerStatus status) -> std::string_view
{
  using enum RunnerStatus;
  switch (status) {
    case Connecting:
      return "connecting";
    case Ready:
      return "ready";
    case Draining:
      return "draining";
    case Disconnected:
      return "disconnected";
  }
  return "unknown";
}

auto
RunnerSnapshot::find_model(std::string_view model_id) const
    -> const ServedModel*
{
  const auto match = std::ranges::find_if(
      models, [model_id](const ServedModel& model) {
        return model.model_id == model_id;
      });
  return match == models.end() ? nullptr : &*match;
}

namespace {

void
validate_registration(
    const std::string& runner_id, const std::vector<ServedModel>& models)
{
  if (runner_id.empty()) {
    throw InvalidRunnerRegistrationException("runner id must not be empty");
  }
  if (models.empty()) {
    throw InvalidRunnerRegistrationException(
        std::format("runner {} advertises no model", runner_id));
  }
  for (const auto& model : models) {
    if (model.model_id.empty()) {
      throw InvalidRunnerRegistrationException(
          std::format("runner {} advertises an unnamed model", runner_id));
    }
    if (model.max_batch_size < 1) {
      throw InvalidRunnerRegistrationException(std::format(
          "runner {} advertises max_batch_size 0 for {}", runner_id,
          model.model_id));
    }
  }
}

auto
serves_model_ready(const RunnerSnapshot& runner, std::string_view model_id)
    -> bool
{
  return runner.status == RunnerStatus::Ready &&
         runner.find_model(model_id) != nullptr;
}

}  // namespace

RunnerRegistry::RunnerRegistry(
    std::chrono::milliseconds heartbeat_timeout, VerbosityLevel verbosity)
    : heartbeat_timeout_(heartbeat_timeout), verbosity_(verbosity)
{
}

RunnerRegistry::~RunnerRegistry()
{
  stop_liveness_sweep();
}

auto
RunnerRegistry::register_runner(
    const std::string& runner_id, std::vector<ServedModel> models,
    std::string connection, Clock::time_point now) -> RunnerHandle
{
  validate_registration(runner_id, models);

  std::size_t count = 0;
  {
    const std::unique_lock lock(mutex_);
    if (runners_.contains(runner_id)) {
      throw DuplicateRunnerException(
          std::format("runner {} is already registered", runner_id));
    }
    RunnerSnapshot runner;
    runner.runner_id = runner_id;
    runner.connection = std::move(connection);
    runner.status = RunnerStatus::Ready;
    runner.models = std::move(models);
    runner.connected_at = now;
    runner.last_heartbeat_at = now;
    runners_.emplace(runner_id, std::move(runner));
    count = runners_.size();
  }
  publish_runner_count(count);
  log_info(verbosity_, std::format("Runner {} registered", runner_id));
  emit(RunnerEvent{RunnerEventType::Registered, runner_id});
  return RunnerHandle{runner_id};
}

auto
RunnerRegistry::heartbeat(
    std::string_view runner_id, std::size_t current_load,
    Clock::time_point now) -> bool
{
  const std::unique_lock lock(mutex_);
  const auto runner = runners_.find(runner_id);
  if (runner == runners_.end()) {
    return false;
  }
  runner->second.last_heartbeat_at = now;
  runner->second.in_flight = current_load;
  return true;
}

auto
RunnerRegistry::mark_draining(std::string_view runner_id) -> bool
{
  {
    const std::unique_lock lock(mutex_);
    const auto runner = runners_.find(runner_id);
    if (runner == runners_.end()) {
      return false;
    }
    if (runner->second.status == RunnerStatus::Draining) {
      return true;
    }
    runner->second.status = RunnerStatus::Draining;
  }
  log_info(verbosity_, std::format("Runner {} is draining", runner_id));
  emit(RunnerEvent{RunnerEventType::Draining, std::string(runner_id)});
  return true;
}

auto
RunnerRegistry::mark_disconnected(std::string_view runner_id) -> bool
{
  std::size_t count = 0;
  {
    const std::unique_lock lock(mutex_);
    const auto runner = runners_.find(runner_id);
    if (runner == runners_.end()) {
      return false;
    }
    runners_.erase(runner);
    count = runners_.size();
  }
  publish_runner_count(count);
  log_info(verbosity_, std::format("Runner {} disconnected", runner_id));
  emit(RunnerEvent{RunnerEventType::RunnerLost, std::string(runner_id)});
  return true;
}

auto
RunnerRegistry::candidates_for(std::string_view model_id) const
    -> std::vector<RunnerSnapshot>
{
  std::vector<RunnerSnapshot> candidates;
  {
    const std::shared_lock lock(mutex_);
    for (const auto& [runner_id, runner] : runners_) {
      if (serves_model_ready(runner, model_id)) {
        candidates.push_back(runner);
      }
    }
  }
  std::ranges::sort(
      candidates, [](const RunnerSnapshot& lhs, const RunnerSnapshot& rhs) {
        if (lhs.in_flight != rhs.in_flight) {
          return lhs.in_flight < rhs.in_flight;
        }
        return lhs.runner_id < rhs.runner_id;
      });
  return candidates;
}

auto
RunnerRegistry::max_batch_size_for(std::string_view model_id) const
    -> std::optional<std::size_t>
{
  std::optional<std::size_t> largest;
  const std::shared_lock lock(mutex_);
  for (const auto& [runner_id, runner] : runners_) {
    if (!serves_model_ready(runner, model_id)) {
      continue;
    }
    const auto size = runner.find_model(model_id)->max_batch_size;
    largest = std::max(largest.value_or(0), size);
  }
  return largest;
}

auto
RunnerRegistry::has_live_runner(std::string_view model_id) const -> bool
{
  return max_batch_size_for(model_id).has_value();
}

auto
RunnerRegistry::find(std::string_view runner_id) const
    -> std::optional<RunnerSnapshot>
{
  const std::shared_lock lock(mutex_);
  const auto runner = runners_.find(runner_id);
  if (runner == runners_.end()) {
    return std::nullopt;
  }
  return runner->second;
}

auto
RunnerRegistry::list_runners() const -> std::vector<RunnerSnapshot>
{
  std::vector<RunnerSnapshot> runners;
  {
    const std::shared_lock lock(mutex_);
    runners.reserve(runners_.size());
    for (const auto& [runner_id, runner] : runners_) {
      runners.push_back(runner);
    }
  }
  std::ranges::sort(runners, {}, &RunnerSnapshot::runner_id);
  return runners;
}

auto
RunnerRegistry::list_models() const -> std::vector<ModelSummary>
{
  std::map<std::string, ModelSummary, std::less<>> models;
  {
    const std::shared_lock lock(mutex_);
    for (const auto& [runner_id, runner] : runners_) {
      if (runner.status != RunnerStatus::Ready) {
        continue;
      }
      for (const auto& model : runner.models) {
        auto& summary = models[model.model_id];
        summary.model_id = model.model_id;
        summary.max_batch_size =
            std::max(summary.max_batch_size, model.max_batch_size);
        ++summary.runner_count;
      }
    }
  }
  std::vector<ModelSummary> summaries;
  summaries.reserve(models.size());
  for (auto& [model_id, summary] : models) {
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

auto
RunnerRegistry::size() const -> std::size_t
{
  const std::shared_lock lock(mutex_);
  return runners_.size();
}

auto
RunnerRegistry::begin_dispatch(std::string_view runner_id) -> bool
{
  const std::unique_lock lock(mutex_);
  const auto runner = runners_.find(runner_id);
  if (runner == runners_.end()) {
    return false;
  }
  ++runner->second.in_flight;
  return true;
}

void
RunnerRegistry::end_dispatch(std::string_view runner_id)
{
  const std::unique_lock lock(mutex_);
  const auto runner = runners_.find(runner_id);
  if (runner != runners_.end() && runner->second.in_flight > 0) {
    --runner->second.in_flight;
  }
}

auto
RunnerRegistry::sweep_stale(Clock::time_point now) -> std::vector<std::string>
{
  std::vector<std::string> evicted;
  std::size_t count = 0;
  {
    const std::unique_lock lock(mutex_);
    for (auto runner = runners_.begin(); runner != runners_.end();) {
      if (now - runner->second.last_heartbeat_at > heartbeat_timeout_) {
        evicted.push_back(runner->first);
        runner = runners_.erase(runner);
      } else {
        ++runner;
      }
    }
    count = runners_.size();
  }

  if (evicted.empty()) {
    return evicted;
  }
  publish_runner_count(count);
  for (const auto& runner_id : evicted) {
    log_warning(std::format(
        "Evicting runner {}: no heartbeat within {} ms", runner_id,
        heartbeat_timeout_.count()));
    emit(RunnerEvent{RunnerEventType::RunnerLost, runner_id});
  }
  return evicted;
}

void
RunnerRegistry::start_liveness_sweep(std::chrono::milliseconds interval)
{
  stop_liveness_sweep();
  sweeper_thread_ = std::jthread([this, interval](const std::stop_token& stop) {
    using namespace std::chrono_literals;
    const auto slice = std::min<std::chrono::milliseconds>(interval, 50ms);
    while (!stop.stop_requested()) {
      for (auto slept = 0ms; slept < interval && !stop.stop_requested();
           slept += slice) {
        std::this_thread::sleep_for(slice);
      }
      if (!stop.stop_requested()) {
        sweep_stale();
      }
    }
  });
}

void
RunnerRegistry::stop_liveness_sweep()
{
  if (sweeper_thread_.joinable()) {
    sweeper_thread_.request_stop();
    sweeper_thread_.join();
  }
}

auto
RunnerRegistry::subscribe(RunnerEventListener listener) -> SubscriptionId
{
  const std::scoped_lock lock(listeners_mutex_);
  const auto subscription = next_subscription_++;
  listeners_.emplace(subscription, std::move(listener));
  return subscription;
}

void
RunnerRegistry::unsubscribe(SubscriptionId subscription)
{
  std::unique_lock lock(listeners_mutex_);
  listeners_.erase(subscription);
  emits_done_.wait(lock, [this] { return active_emits_ == 0; });
}

void
RunnerRegistry::emit(const RunnerEvent& event)
{
  std::vector<RunnerEventListener> listeners;
  {
    const std::scoped_lock lock(listeners_mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [subscription, listener] : listeners_) {
      listeners.push_back(listener);
    }
    ++active_emits_;
  }
  for (const auto& listener : listeners) {
    try {
      listener(event);
    }
    catch (const std::exception& e) {
      log_error(std::format(
          "Runner event listener failed for {}: {}", event.runner_id,
          e.what()));
    }
  }
  {
    const std::scoped_lock lock(listeners_mutex_);
    --active_emits_;
  }
  emits_done_.notify_all();
}

void
RunnerRegistry::publish_runner_count(std::size_t count) const
{
  set_runners_registered(count);
}

}  // namespace inference_gateway
