#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "model_queue.hpp"
#include "queued_request.hpp"
#include "utils/runtime_config.hpp"
#include "utils/transparent_hash.hpp"

namespace inference_gateway {

// =============================================================================
// Batch
// -----------------------------------------------------------------------------
// Contiguous prefix of one ModelQueue, alive for a single dispatch.
// =============================================================================
struct Batch {
  std::uint64_t batch_id = 0;
  std::string model_id;
  std::vector<QueuedRequestPtr> requests;
  std::string runner_id;
  Clock::time_point dispatched_at;

  [[nodiscard]] auto size() const -> std::size_t { return requests.size(); }
};

// =============================================================================
// BatchQueue
// -----------------------------------------------------------------------------
// Owns one ModelQueue per model id. Queues are created on first enqueue and
// never removed. The map is guarded by a reader/writer lock; queue contents
// by each ModelQueue's own mutex.
// =============================================================================
class BatchQueue {
 public:
  /// Largest batch a live runner accepts for a model, or nullopt when no
  /// live runner serves it.
  using CapacityLookup =
      std::function<std::optional<std::size_t>(std::string_view)>;
  using WakeCallback = std::function<void()>;

  explicit BatchQueue(BatchQueueConfig config);

  /// Must be installed before producers start enqueueing. With a capacity
  /// lookup, a model wakes the consumer once its depth reaches the smaller
  /// of min_batch_size and its runners' largest batch.
  void set_wake_callback(WakeCallback wake, CapacityLookup capacity = {});

  auto enqueue(QueuedRequestPtr request) -> QueuedRequestPtr;

  [[nodiscard]] auto ready_models(
      const CapacityLookup& lookup, Clock::time_point now = Clock::now()) const
      -> std::vector<std::string>;
  [[nodiscard]] auto is_ready(
      std::string_view model_id, std::optional<std::size_t> max_batch_size,
      Clock::time_point now = Clock::now()) const -> bool;

  auto take_batch(std::string_view model_id, std::size_t max_size)
      -> std::optional<Batch>;
  auto remove(std::string_view request_id) -> QueuedRequestPtr;
  auto expire_unserved(
      std::string_view model_id, std::chrono::milliseconds timeout,
      Clock::time_point now = Clock::now()) -> std::vector<QueuedRequestPtr>;
  auto drain_all() -> std::vector<QueuedRequestPtr>;

  [[nodiscard]] auto depths() const
      -> std::vector<std::pair<std::string, std::size_t>>;
  [[nodiscard]] auto pending_count(std::string_view model_id) const
      -> std::size_t;
  [[nodiscard]] auto config() const -> const BatchQueueConfig&
  {
    return config_;
  }

 private:
  using QueueMap = StringMap<std::unique_ptr<ModelQueue>>;

  auto queue_for(std::string_view model_id) -> ModelQueue&;
  [[nodiscard]] auto find_queue(std::string_view model_id) const
      -> ModelQueue*;
  [[nodiscard]] auto state_is_ready(
      const ModelQueue::State& state,
      std::optional<std::size_t> max_batch_size,
      Clock::time_point now) const -> bool;

  BatchQueueConfig config_;
  WakeCallback wake_;
  CapacityLookup wake_capacity_;
  mutable std::shared_mutex map_mutex_;
  QueueMap queues_;
};

}  // namespace inference_gateway
