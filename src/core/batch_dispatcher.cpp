#include "batch_dispatcher.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace inference_gateway {

namespace {

template <typename Exception>
void
fail_all(const std::vector<QueuedRequestPtr>& requests, const std::string& why)
{
  const auto error = std::make_exception_ptr(Exception(why));
  for (const auto& request : requests) {
    request->resolve(RequestOutcome::failure(error));
  }
}

auto
elapsed_ms(Clock::time_point from, Clock::time_point to) -> double
{
  return std::chrono::duration<double, std::milli>(to - from).count();
}

}  // namespace

BatchDispatcher::BatchDispatcher(
    BatchQueue& queue, RunnerRegistry& registry, RunnerExecutor& executor,
    DispatcherSettings settings, VerbosityLevel verbosity)
    : queue_(queue), registry_(registry), executor_(executor),
      settings_(settings), verbosity_(verbosity)
{
  queue_.set_wake_callback(
      [this] { wake(); },
      [this](std::string_view model_id) {
        return registry_.max_batch_size_for(model_id);
      });
  subscription_ = registry_.subscribe(
      [this](const RunnerEvent& event) { on_runner_event(event); });
}

BatchDispatcher::~BatchDispatcher()
{
  registry_.unsubscribe(subscription_);
  queue_.set_wake_callback({});
  stop();
}

void
BatchDispatcher::start()
{
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::jthread(
      [this](const std::stop_token& stop) { worker_loop(stop); });
  log_info(
      verbosity_, std::format(
                      "Batch dispatcher started (tick {} ms)",
                      settings_.tick.count()));
}

void
BatchDispatcher::stop()
{
  if (worker_.joinable()) {
    worker_.request_stop();
    wake_cv_.notify_all();
    worker_.join();
  }

  std::vector<InFlightBatch> aborted;
  {
    const std::scoped_lock lock(in_flight_mutex_);
    aborted.reserve(in_flight_.size());
    for (auto& [batch_id, batch] : in_flight_) {
      aborted.push_back(std::move(batch));
    }
    in_flight_.clear();
  }
  for (const auto& batch : aborted) {
    registry_.end_dispatch(batch.runner_id);
    fail_all<CancelledException>(batch.requests, "gateway is shutting down");
  }
}

void
BatchDispatcher::wake()
{
  {
    const std::scoped_lock lock(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_one();
}

void
BatchDispatcher::worker_loop(const std::stop_token& stop)
{
  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(wake_mutex_);
      wake_cv_.wait_for(
          lock, stop, settings_.tick, [this] { return wake_pending_; });
      wake_pending_ = false;
    }
    if (stop.stop_requested()) {
      break;
    }
    try {
      std::size_t progressed = 0;
      do {
        progressed = run_cycle();
      } while (progressed > 0 && !stop.stop_requested());
    }
    catch (const std::exception& e) {
      log_error(std::format("Dispatcher cycle failed: {}", e.what()));
    }
  }
}

auto
BatchDispatcher::run_cycle(Clock::time_point now) -> std::size_t
{
  const auto ready = queue_.ready_models(
      [this](std::string_view model_id) {
        return registry_.max_batch_size_for(model_id);
      },
      now);

  std::size_t progressed = 0;
  for (const auto& model_id : ready) {
    if (dispatch_model(model_id, now)) {
      ++progressed;
    }
  }
  return progressed;
}

auto
BatchDispatcher::dispatch_model(
    const std::string& model_id, Clock::time_point now) -> bool
{
  const auto candidates = registry_.candidates_for(model_id);
  if (candidates.empty()) {
    return expire_unserved(model_id, now);
  }

  const auto& runner = candidates.front();
  const auto* served = runner.find_model(model_id);
  if (served == nullptr) {
    return false;
  }
  auto batch = queue_.take_batch(model_id, served->max_batch_size);
  if (!batch.has_value()) {
    return false;
  }
  for (const auto& request : batch->requests) {
    observe_queue_wait_ms(elapsed_ms(request->enqueued_at(), now));
  }
  send(std::move(*batch), runner, *served, true);
  return true;
}

auto
BatchDispatcher::expire_unserved(
    const std::string& model_id, Clock::time_point now) -> bool
{
  const auto expired =
      queue_.expire_unserved(model_id, settings_.no_runner_timeout, now);
  if (expired.empty()) {
    return false;
  }
  log_warning(std::format(
      "{} request(s) for model {} expired: no runner within {} ms",
      expired.size(), model_id, settings_.no_runner_timeout.count()));
  fail_all<QueueTimeoutException>(
      expired, std::format(
                   "no runner served model {} within {} ms", model_id,
                   settings_.no_runner_timeout.count()));
  return true;
}

auto
BatchDispatcher::dispatch_immediate(
    const QueuedRequestPtr& request, const RunnerSnapshot& runner,
    const CallTrackedHook& on_tracked) -> std::uint64_t
{
  Batch batch;
  batch.model_id = request->model_id();
  batch.requests.push_back(request);

  const auto* served = runner.find_model(request->model_id());
  if (served == nullptr) {
    request->fail<ModelUnavailableException>(std::format(
        "runner {} does not serve model {}", runner.runner_id,
        request->model_id()));
    return 0;
  }
  batch.batch_id = next_batch_id_.fetch_add(1, std::memory_order_relaxed);
  const auto call_id = batch.batch_id;
  send(std::move(batch), runner, *served, false, on_tracked);
  return call_id;
}

void
BatchDispatcher::send(
    Batch batch, const RunnerSnapshot& runner, const ServedModel& model,
    bool batched, const CallTrackedHook& on_tracked)
{
  if (batch.batch_id == 0) {
    batch.batch_id = next_batch_id_.fetch_add(1, std::memory_order_relaxed);
  }
  batch.runner_id = runner.runner_id;
  batch.dispatched_at = Clock::now();
  const auto batch_id = batch.batch_id;

  ExecutionRequest call;
  call.call_id = batch_id;
  call.runner_id = runner.runner_id;
  call.connection = runner.connection;
  call.model_id = batch.model_id;
  call.engine_model_name = model.engine_model_name();
  call.requests.reserve(batch.requests.size());
  for (const auto& request : batch.requests) {
    call.requests.push_back(request->payload());
    call.requests.back().model = call.engine_model_name;
  }

  const auto size = batch.requests.size();
  {
    const std::scoped_lock lock(in_flight_mutex_);
    in_flight_.emplace(
        batch_id, InFlightBatch{
                      batch.runner_id, batch.model_id,
                      std::move(batch.requests), batch.dispatched_at});
  }
  if (on_tracked) {
    on_tracked(batch_id);
  }

  // The runner may have vanished since candidates_for().
  if (!registry_.begin_dispatch(runner.runner_id)) {
    if (auto lost = extract(batch_id)) {
      fail_all<RunnerLostException>(
          lost->requests,
          std::format("runner {} is no longer registered", runner.runner_id));
    }
    return;
  }

  if (batched) {
    record_batch_dispatched(size);
  }
  log_debug(
      verbosity_, std::format(
                      "Dispatching batch {} ({} request(s), model {}) to {}",
                      batch_id, size, call.model_id, call.runner_id));

  try {
    executor_.execute(
        std::move(call), [this, batch_id](ExecutionResult result) {
          on_complete(batch_id, std::move(result));
        });
  }
  catch (const std::exception& e) {
    log_error(std::format(
        "Failed to send batch {} to runner {}: {}", batch_id,
        runner.runner_id, e.what()));
    if (auto failed = extract(batch_id)) {
      registry_.end_dispatch(failed->runner_id);
      fail_all<ExecutionFailedException>(
          failed->requests,
          std::format("could not reach runner {}", runner.runner_id));
    }
  }
}

void
BatchDispatcher::on_complete(std::uint64_t batch_id, ExecutionResult result)
{
  auto batch = extract(batch_id);
  if (!batch.has_value()) {
    log_trace(
        verbosity_,
        std::format("Discarding late completion of batch {}", batch_id));
    return;
  }
  registry_.end_dispatch(batch->runner_id);
  log_trace(
      verbosity_,
      std::format(
          "Batch {} completed on {} after {:.2f} ms", batch_id,
          batch->runner_id, elapsed_ms(batch->dispatched_at, Clock::now())));
  resolve_results(*batch, std::move(result));
}

void
BatchDispatcher::resolve_results(
    const InFlightBatch& batch, ExecutionResult result)
{
  if (result.error) {
    for (const auto& request : batch.requests) {
      request->resolve(RequestOutcome::failure(result.error));
    }
    return;
  }

  if (result.items.size() != batch.requests.size()) {
    fail_all<ExecutionFailedException>(
        batch.requests,
        std::format(
            "runner {} returned {} result(s) for {} request(s)",
            batch.runner_id, result.items.size(), batch.requests.size()));
    return;
  }

  for (std::size_t idx = 0; idx < batch.requests.size(); ++idx) {
    const auto& request = batch.requests[idx];
    auto& item = result.items[idx];
    if (!item.response.has_value()) {
      request->fail<ExecutionFailedException>(
          item.error.empty() ? std::string("runner returned no response")
                             : item.error);
      continue;
    }
    auto response = std::move(*item.response);
    response.request_id = request->request_id();
    response.model = request->model_id();
    response.runner_id = batch.runner_id;
    request->succeed(std::move(response));
  }
}

auto
BatchDispatcher::cancel_call(std::uint64_t call_id) -> bool
{
  auto batch = extract(call_id);
  if (!batch.has_value()) {
    return false;
  }
  registry_.end_dispatch(batch->runner_id);
  fail_all<CancelledException>(batch->requests, "request cancelled");
  executor_.cancel(call_id);
  return true;
}

void
BatchDispatcher::on_runner_event(const RunnerEvent& event)
{
  if (event.type != RunnerEventType::RunnerLost) {
    return;
  }
  const auto lost = extract_runner(event.runner_id);
  if (lost.empty()) {
    return;
  }
  log_warning(std::format(
      "Runner {} lost with {} batch(es) in flight", event.runner_id,
      lost.size()));
  for (const auto& batch : lost) {
    fail_all<RunnerLostException>(
        batch.requests,
        std::format("runner {} disconnected", event.runner_id));
  }
}

auto
BatchDispatcher::extract(std::uint64_t batch_id)
    -> std::optional<InFlightBatch>
{
  const std::scoped_lock lock(in_flight_mutex_);
  auto node = in_flight_.extract(batch_id);
  if (node.empty()) {
    return std::nullopt;
  }
  return std::move(node.mapped());
}

auto
BatchDispatcher::extract_runner(std::string_view runner_id)
    -> std::vector<InFlightBatch>
{
  std::vector<InFlightBatch> extracted;
  const std::scoped_lock lock(in_flight_mutex_);
  for (auto entry = in_flight_.begin(); entry != in_flight_.end();) {
    if (entry->second.runner_id == runner_id) {
      extracted.push_back(std::move(entry->second));
      entry = in_flight_.erase(entry);
    } else {
      ++entry;
    }
  }
  return extracted;
}

auto
BatchDispatcher::in_flight_batches() const -> std::size_t
{
  const std::scoped_lock lock(in_flight_mutex_);
  return in_flight_.size();
}

auto
BatchDispatcher::in_flight_batches_for(std::string_view runner_id) const
    -> std::size_t
{
  const std::scoped_lock lock(in_flight_mutex_);
  std::size_t count = 0;
  for (const auto& [batch_id, batch] : in_flight_) {
    if (batch.runner_id == runner_id) {
      ++count;
    }
  }
  return count;
}

}  // namespace inference_gateway
