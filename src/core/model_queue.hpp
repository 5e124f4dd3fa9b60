#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "queued_request.hpp"

namespace inference_gateway {

// =============================================================================
// ModelQueue
// -----------------------------------------------------------------------------
// FIFO of pending requests for one model. Insertion order is the dispatch
// order; entries leave only from the front, except for explicit cancellation.
// Every member locks the queue's own mutex, so traffic for one model never
// waits on another model's queue.
// =============================================================================
class ModelQueue {
 public:
  struct State {
    std::size_t depth = 0;
    std::optional<Clock::time_point> oldest_enqueued_at;
  };

  /// Returns the depth after insertion.
  auto push(QueuedRequestPtr request) -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    if (requests_.empty()) {
      oldest_enqueued_at_ = request->enqueued_at();
    }
    requests_.push_back(std::move(request));
    return requests_.size();
  }

  auto take_front(std::size_t max_size) -> std::vector<QueuedRequestPtr>
  {
    const std::scoped_lock lock(mutex_);
    const auto count = std::min(max_size, requests_.size());
    std::vector<QueuedRequestPtr> taken(
        std::make_move_iterator(requests_.begin()),
        std::make_move_iterator(
            requests_.begin() + static_cast<std::ptrdiff_t>(count)));
    requests_.erase(
        requests_.begin(),
        requests_.begin() + static_cast<std::ptrdiff_t>(count));
    refresh_anchor();
    return taken;
  }

  /// Removes front entries enqueued at or before the cutoff.
  auto take_expired(Clock::time_point cutoff) -> std::vector<QueuedRequestPtr>
  {
    const std::scoped_lock lock(mutex_);
    std::vector<QueuedRequestPtr> expired;
    while (!requests_.empty() && requests_.front()->enqueued_at() <= cutoff) {
      expired.push_back(std::move(requests_.front()));
      requests_.pop_front();
    }
    refresh_anchor();
    return expired;
  }

  auto remove(std::string_view request_id) -> QueuedRequestPtr
  {
    const std::scoped_lock lock(mutex_);
    const auto match = std::ranges::find_if(
        requests_, [request_id](const QueuedRequestPtr& request) {
          return request->request_id() == request_id;
        });
    if (match == requests_.end()) {
      return nullptr;
    }
    auto removed = std::move(*match);
    requests_.erase(match);
    refresh_anchor();
    return removed;
  }

  auto drain() -> std::vector<QueuedRequestPtr>
  {
    return take_front(std::numeric_limits<std::size_t>::max());
  }

  [[nodiscard]] auto state() const -> State
  {
    const std::scoped_lock lock(mutex_);
    return State{requests_.size(), oldest_enqueued_at_};
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return requests_.size();
  }

 private:
  void refresh_anchor()
  {
    if (requests_.empty()) {
      oldest_enqueued_at_.reset();
    } else {
      oldest_enqueued_at_ = requests_.front()->enqueued_at();
    }
  }

  mutable std::mutex mutex_;
  std::deque<QueuedRequestPtr> requests_;
  std::optional<Clock::time_point> oldest_enqueued_at_;
};

}  // namespace inference_gateway
