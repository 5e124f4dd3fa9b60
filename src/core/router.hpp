#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "batch_dispatcher.hpp"
#include "batch_queue.hpp"
#include "chat_types.hpp"
#include "queued_request.hpp"
#include "runner_registry.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"
#include "utils/transparent_hash.hpp"

namespace inference_gateway {

struct RouterSettings {
  bool batching_enabled = true;
  RuntimeConfig::ModelClasses model_classes{};
};

// =============================================================================
// Router
// -----------------------------------------------------------------------------
// Entry point of the core. Resolves the requested model, then either queues
// the request for batching or sends it straight to the least-loaded runner.
// Every accepted request resolves exactly once through its callback or
// future; failures arrive as RequestFailedException subclasses.
// =============================================================================
class Router {
 public:
  Router(
      RunnerRegistry& registry, BatchQueue& queue, BatchDispatcher& dispatcher,
      RouterSettings settings,
      VerbosityLevel verbosity = VerbosityLevel::Silent);
  Router(const Router&) = delete;
  auto operator=(const Router&) -> Router& = delete;
  Router(Router&&) = delete;
  auto operator=(Router&&) -> Router& = delete;
  ~Router() = default;

  auto submit(ChatCompletionRequest request)
      -> std::future<ChatCompletionResponse>;
  /// Returns the request id, generated when the caller left it empty.
  auto submit_async(ChatCompletionRequest request, ResultCallback callback)
      -> std::string;
  /// Resolves the request Cancelled wherever it sits. False when the id is
  /// unknown or the request already resolved.
  auto cancel(std::string_view request_id) -> bool;

  [[nodiscard]] auto resolve_model(std::string_view model) const
      -> std::string;
  [[nodiscard]] auto list_runners() const -> std::vector<RunnerSnapshot>;
  [[nodiscard]] auto list_models() const -> std::vector<ModelSummary>;
  [[nodiscard]] auto queue_depths() const
      -> std::vector<std::pair<std::string, std::size_t>>;
  [[nodiscard]] auto pending_requests() const -> std::size_t;

  /// Stops accepting requests and resolves every still-queued one
  /// Cancelled. Later submissions resolve Cancelled immediately.
  void shutdown();

 private:
  struct Tracked {
    QueuedRequestPtr request;
    std::optional<std::uint64_t> call_id;
  };

  auto next_request_id() -> std::string;
  void route_immediate(const QueuedRequestPtr& request);
  void forget(const std::string& request_id);

  RunnerRegistry& registry_;
  BatchQueue& queue_;
  BatchDispatcher& dispatcher_;
  RouterSettings settings_;
  VerbosityLevel verbosity_;

  std::atomic<std::uint64_t> next_request_{1};
  std::shared_mutex lifecycle_mutex_;
  bool closed_ = false;
  mutable std::mutex tracked_mutex_;
  StringMap<Tracked> tracked_;
};

}  // namespace inference_gateway
