#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "batch_queue.hpp"
#include "queued_request.hpp"
#include "runner_executor.hpp"
#include "runner_registry.hpp"
#include "utils/logger.hpp"

namespace inference_gateway {

/// Receives the call id of an immediate dispatch once the call is tracked
/// and before the transport sees it.
using CallTrackedHook = std::function<void(std::uint64_t)>;

struct DispatcherSettings {
  std::chrono::milliseconds tick = kDefaultDispatchTick;
  std::chrono::milliseconds no_runner_timeout = kDefaultNoRunnerTimeout;
};

// =============================================================================
// BatchDispatcher
// -----------------------------------------------------------------------------
// Single worker that turns ready model queues into runner calls. It wakes on
// a fixed tick and whenever BatchQueue::enqueue reaches the size threshold.
//
// Every dispatched batch sits in the in-flight table until exactly one of
// these removes it: the executor completion, a RunnerLost event for its
// runner, a call cancellation or stop(). Whoever removes the entry resolves
// its requests; everybody else finds nothing and does nothing.
// =============================================================================
class BatchDispatcher {
 public:
  BatchDispatcher(
      BatchQueue& queue, RunnerRegistry& registry, RunnerExecutor& executor,
      DispatcherSettings settings,
      VerbosityLevel verbosity = VerbosityLevel::Silent);
  ~BatchDispatcher();
  BatchDispatcher(const BatchDispatcher&) = delete;
  auto operator=(const BatchDispatcher&) -> BatchDispatcher& = delete;
  BatchDispatcher(BatchDispatcher&&) = delete;
  auto operator=(BatchDispatcher&&) -> BatchDispatcher& = delete;

  void start();
  /// Stops the worker and resolves every in-flight request Cancelled.
  void stop();
  void wake();

  /// One pass over the ready models. Returns how many models made progress.
  auto run_cycle(Clock::time_point now = Clock::now()) -> std::size_t;

  /// Sends a single request to the given runner outside of any batch.
  /// Returns the call id usable with cancel_call(), or 0 when nothing was
  /// sent. on_tracked sees the same id before the call starts.
  auto dispatch_immediate(
      const QueuedRequestPtr& request, const RunnerSnapshot& runner,
      const CallTrackedHook& on_tracked = {}) -> std::uint64_t;
  /// Resolves the call's requests Cancelled and cancels the transport call.
  auto cancel_call(std::uint64_t call_id) -> bool;

  [[nodiscard]] auto in_flight_batches() const -> std::size_t;
  [[nodiscard]] auto in_flight_batches_for(std::string_view runner_id) const
      -> std::size_t;

 private:
  struct InFlightBatch {
    std::string runner_id;
    std::string model_id;
    std::vector<QueuedRequestPtr> requests;
    Clock::time_point dispatched_at;
  };

  void worker_loop(const std::stop_token& stop);
  auto dispatch_model(const std::string& model_id, Clock::time_point now)
      -> bool;
  auto expire_unserved(const std::string& model_id, Clock::time_point now)
      -> bool;
  void send(
      Batch batch, const RunnerSnapshot& runner, const ServedModel& model,
      bool batched, const CallTrackedHook& on_tracked = {});
  void on_complete(std::uint64_t batch_id, ExecutionResult result);
  void on_runner_event(const RunnerEvent& event);
  auto extract(std::uint64_t batch_id) -> std::optional<InFlightBatch>;
  auto extract_runner(std::string_view runner_id)
      -> std::vector<InFlightBatch>;
  void resolve_results(const InFlightBatch& batch, ExecutionResult result);

  BatchQueue& queue_;
  RunnerRegistry& registry_;
  RunnerExecutor& executor_;
  DispatcherSettings settings_;
  VerbosityLevel verbosity_;
  RunnerRegistry::SubscriptionId subscription_ = 0;

  std::mutex wake_mutex_;
  std::condition_variable_any wake_cv_;
  bool wake_pending_ = false;

  mutable std::mutex in_flight_mutex_;
  std::unordered_map<std::uint64_t, InFlightBatch> in_flight_;
  std::atomic<std::uint64_t> next_batch_id_{1};

  std::jthread worker_;
};

}  // namespace inference_gateway
