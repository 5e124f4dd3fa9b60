#include "router.hpp"

#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace inference_gateway {

namespace {

constexpr std::string_view kModelClassPrefix = "class:";

auto
outcome_kind(const RequestOutcome& outcome) -> std::string_view
{
  if (outcome.ok()) {
    return "success";
  }
  try {
    std::rethrow_exception(outcome.error);
  }
  catch (const RequestFailedException& e) {
    return to_string(e.kind());
  }
  catch (const std::exception&) {
    return "error";
  }
}

}  // namespace

Router::Router(
    RunnerRegistry& registry, BatchQueue& queue, BatchDispatcher& dispatcher,
    RouterSettings settings, VerbosityLevel verbosity)
    : registry_(registry), queue_(queue), dispatcher_(dispatcher),
      settings_(std::move(settings)), verbosity_(verbosity)
{
}

auto
Router::submit(ChatCompletionRequest request)
    -> std::future<ChatCompletionResponse>
{
  auto result_promise =
      std::make_shared<std::promise<ChatCompletionResponse>>();
  auto result_future = result_promise->get_future();
  submit_async(
      std::move(request), [result_promise](RequestOutcome outcome) {
        if (outcome.ok()) {
          result_promise->set_value(std::move(*outcome.response));
        } else {
          result_promise->set_exception(outcome.error);
        }
      });
  return result_future;
}

auto
Router::submit_async(ChatCompletionRequest request, ResultCallback callback)
    -> std::string
{
  if (request.request_id.empty()) {
    request.request_id = next_request_id();
  }
  auto request_id = request.request_id;
  auto model_id = resolve_model(request.model);
  if (model_id != request.model) {
    log_trace(
        verbosity_,
        std::format("Model {} resolved to {}", request.model, model_id));
    request.model = model_id;
  }
  const bool immediate = request.stream || !settings_.batching_enabled;

  auto on_complete = [this, request_id, callback = std::move(callback)](
                         RequestOutcome outcome) {
    record_outcome(outcome_kind(outcome));
    forget(request_id);
    if (callback) {
      callback(std::move(outcome));
    }
  };
  auto queued = std::make_shared<QueuedRequest>(
      std::move(model_id), std::move(request), std::move(on_complete));

  {
    const std::scoped_lock lock(tracked_mutex_);
    if (!tracked_.try_emplace(request_id, Tracked{queued, std::nullopt})
             .second) {
      throw std::invalid_argument(
          std::format("request {} is already pending", request_id));
    }
  }

  const std::shared_lock lifecycle(lifecycle_mutex_);
  if (closed_) {
    queued->fail<CancelledException>("gateway is shutting down");
    return request_id;
  }
  if (immediate) {
    record_request("immediate");
    route_immediate(queued);
  } else {
    record_request("batched");
    log_trace(
        verbosity_, std::format(
                        "Queueing request {} for model {}", request_id,
                        queued->model_id()));
    queue_.enqueue(queued);
  }
  return request_id;
}

void
Router::route_immediate(const QueuedRequestPtr& request)
{
  const auto candidates = registry_.candidates_for(request->model_id());
  if (candidates.empty()) {
    request->fail<ModelUnavailableException>(std::format(
        "no live runner serves model {}", request->model_id()));
    return;
  }

  dispatcher_.dispatch_immediate(
      request, candidates.front(), [this, &request](std::uint64_t call_id) {
        const std::scoped_lock lock(tracked_mutex_);
        if (const auto tracked = tracked_.find(request->request_id());
            tracked != tracked_.end()) {
          tracked->second.call_id = call_id;
        }
      });
}

auto
Router::cancel(std::string_view request_id) -> bool
{
  Tracked tracked;
  {
    const std::scoped_lock lock(tracked_mutex_);
    const auto found = tracked_.find(request_id);
    if (found == tracked_.end()) {
      return false;
    }
    tracked = found->second;
  }

  if (auto removed = queue_.remove(request_id)) {
    removed->fail<CancelledException>(
        std::format("request {} cancelled", request_id));
    return true;
  }
  if (tracked.call_id.has_value() &&
      dispatcher_.cancel_call(*tracked.call_id)) {
    return true;
  }
  // Already part of a dispatched batch: the batch keeps running and the
  // runner's answer for this request is dropped by the resolved sink.
  log_debug(
      verbosity_,
      std::format("Request {} already dispatched; cancelling", request_id));
  return tracked.request->fail<CancelledException>(
      std::format("request {} cancelled", request_id));
}

auto
Router::resolve_model(std::string_view model) const -> std::string
{
  if (!model.starts_with(kModelClassPrefix)) {
    return std::string(model);
  }
  const auto model_class = model.substr(kModelClassPrefix.size());
  const std::vector<std::string>* members = nullptr;
  if (model_class == "fast") {
    members = &settings_.model_classes.fast;
  } else if (model_class == "big") {
    members = &settings_.model_classes.big;
  }
  if (members == nullptr || members->empty()) {
    return std::string(model);
  }
  for (const auto& member : *members) {
    if (registry_.has_live_runner(member)) {
      return member;
    }
  }
  return members->front();
}

auto
Router::list_runners() const -> std::vector<RunnerSnapshot>
{
  return registry_.list_runners();
}

auto
Router::list_models() const -> std::vector<ModelSummary>
{
  return registry_.list_models();
}

auto
Router::queue_depths() const
    -> std::vector<std::pair<std::string, std::size_t>>
{
  return queue_.depths();
}

auto
Router::pending_requests() const -> std::size_t
{
  const std::scoped_lock lock(tracked_mutex_);
  return tracked_.size();
}

void
Router::shutdown()
{
  {
    const std::unique_lock lifecycle(lifecycle_mutex_);
    closed_ = true;
  }
  const auto drained = queue_.drain_all();
  if (!drained.empty()) {
    log_info(
        verbosity_, std::format(
                        "Cancelling {} queued request(s) on shutdown",
                        drained.size()));
  }
  for (const auto& request : drained) {
    request->fail<CancelledException>("gateway is shutting down");
  }
}

auto
Router::next_request_id() -> std::string
{
  return std::format(
      "req-{:08x}", next_request_.fetch_add(1, std::memory_order_relaxed));
}

void
Router::forget(const std::string& request_id)
{
  const std::scoped_lock lock(tracked_mutex_);
  tracked_.erase(request_id);
}

}  // namespace inference_gateway
