#include "batch_queue.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "monitoring/metrics.hpp"

namespace inference_gateway {

BatchQueue::BatchQueue(BatchQueueConfig config) : config_(config)
{
  if (config_.min_batch_size < 1) {
    throw std::invalid_argument("min_batch_size must be >= 1");
  }
}

void
BatchQueue::set_wake_callback(WakeCallback wake, CapacityLookup capacity)
{
  wake_ = std::move(wake);
  wake_capacity_ = std::move(capacity);
}

auto
BatchQueue::queue_for(std::string_view model_id) -> ModelQueue&
{
  {
    const std::shared_lock lock(map_mutex_);
    if (const auto found = queues_.find(model_id); found != queues_.end()) {
      return *found->second;
    }
  }
  const std::unique_lock lock(map_mutex_);
  auto [entry, inserted] = queues_.try_emplace(std::string(model_id));
  if (inserted) {
    entry->second = std::make_unique<ModelQueue>();
  }
  return *entry->second;
}

auto
BatchQueue::find_queue(std::string_view model_id) const -> ModelQueue*
{
  const std::shared_lock lock(map_mutex_);
  const auto found = queues_.find(model_id);
  return found == queues_.end() ? nullptr : found->second.get();
}

auto
BatchQueue::enqueue(QueuedRequestPtr request) -> QueuedRequestPtr
{
  if (request == nullptr) {
    throw std::invalid_argument("cannot enqueue a null request");
  }
  auto& queue = queue_for(request->model_id());
  const auto depth = queue.push(request);
  set_model_queue_depth(request->model_id(), depth);
  if (!wake_) {
    return request;
  }
  auto threshold = config_.min_batch_size;
  if (wake_capacity_) {
    if (const auto capacity = wake_capacity_(request->model_id());
        capacity.has_value() && *capacity > 0) {
      threshold = std::min(threshold, *capacity);
    }
  }
  if (depth >= threshold) {
    wake_();
  }
  return request;
}

auto
BatchQueue::state_is_ready(
    const ModelQueue::State& state, std::optional<std::size_t> max_batch_size,
    Clock::time_point now) const -> bool
{
  if (state.depth == 0) {
    return false;
  }
  // No live runner: the dispatcher must still visit the model to enforce
  // the no-runner timeout.
  if (!max_batch_size.has_value()) {
    return true;
  }
  const auto threshold = std::min(config_.min_batch_size, *max_batch_size);
  if (state.depth >= threshold) {
    return true;
  }
  return state.oldest_enqueued_at.has_value() &&
         now - *state.oldest_enqueued_at >= config_.batch_timeout;
}

auto
BatchQueue::is_ready(
    std::string_view model_id, std::optional<std::size_t> max_batch_size,
    Clock::time_point now) const -> bool
{
  const auto* queue = find_queue(model_id);
  return queue != nullptr &&
         state_is_ready(queue->state(), max_batch_size, now);
}

auto
BatchQueue::ready_models(
    const CapacityLookup& lookup, Clock::time_point now) const
    -> std::vector<std::string>
{
  std::vector<std::pair<std::string, ModelQueue::State>> snapshot;
  {
    const std::shared_lock lock(map_mutex_);
    snapshot.reserve(queues_.size());
    for (const auto& [model_id, queue] : queues_) {
      snapshot.emplace_back(model_id, queue->state());
    }
  }

  std::vector<std::string> ready;
  for (auto& [model_id, state] : snapshot) {
    if (state.depth == 0) {
      continue;
    }
    if (state_is_ready(state, lookup(model_id), now)) {
      ready.push_back(std::move(model_id));
    }
  }
  std::ranges::sort(ready);
  return ready;
}

auto
BatchQueue::take_batch(std::string_view model_id, std::size_t max_size)
    -> std::optional<Batch>
{
  auto* queue = find_queue(model_id);
  if (queue == nullptr || max_size == 0) {
    return std::nullopt;
  }
  auto requests = queue->take_front(max_size);
  set_model_queue_depth(model_id, queue->size());
  if (requests.empty()) {
    return std::nullopt;
  }
  Batch batch;
  batch.model_id = std::string(model_id);
  batch.requests = std::move(requests);
  return batch;
}

auto
BatchQueue::remove(std::string_view request_id) -> QueuedRequestPtr
{
  std::vector<std::pair<std::string, ModelQueue*>> queues;
  {
    const std::shared_lock lock(map_mutex_);
    queues.reserve(queues_.size());
    for (const auto& [model_id, queue] : queues_) {
      queues.emplace_back(model_id, queue.get());
    }
  }
  for (const auto& [model_id, queue] : queues) {
    if (auto removed = queue->remove(request_id)) {
      set_model_queue_depth(model_id, queue->size());
      return removed;
    }
  }
  return nullptr;
}

auto
BatchQueue::expire_unserved(
    std::string_view model_id, std::chrono::milliseconds timeout,
    Clock::time_point now) -> std::vector<QueuedRequestPtr>
{
  auto* queue = find_queue(model_id);
  if (queue == nullptr) {
    return {};
  }
  auto expired = queue->take_expired(now - timeout);
  if (!expired.empty()) {
    set_model_queue_depth(model_id, queue->size());
  }
  return expired;
}

auto
BatchQueue::drain_all() -> std::vector<QueuedRequestPtr>
{
  std::vector<QueuedRequestPtr> drained;
  const std::shared_lock lock(map_mutex_);
  for (const auto& [model_id, queue] : queues_) {
    auto pending = queue->drain();
    drained.insert(
        drained.end(), std::make_move_iterator(pending.begin()),
        std::make_move_iterator(pending.end()));
    set_model_queue_depth(model_id, 0);
  }
  return drained;
}

auto
BatchQueue::depths() const -> std::vector<std::pair<std::string, std::size_t>>
{
  std::vector<std::pair<std::string, std::size_t>> depths;
  {
    const std::shared_lock lock(map_mutex_);
    depths.reserve(queues_.size());
    for (const auto& [model_id, queue] : queues_) {
      depths.emplace_back(model_id, queue->size());
    }
  }
  std::ranges::sort(depths);
  return depths;
}

auto
BatchQueue::pending_count(std::string_view model_id) const -> std::size_t
{
  const auto* queue = find_queue(model_id);
  return queue == nullptr ? 0 : queue->size();
}

}  // namespace inference_gateway
