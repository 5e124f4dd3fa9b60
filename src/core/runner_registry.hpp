#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "queued_request.hpp"
#include "utils/logger.hpp"
#include "utils/transparent_hash.hpp"

namespace inference_gateway {

enum class RunnerStatus : std::uint8_t {
  Connecting,
  Ready,
  Draining,
  Disconnected
};

auto to_string(RunnerStatus status) -> std::string_view;

struct ServedModel {
  std::string model_id;
  std::size_t max_batch_size = 1;
  std::string engine_type;
  // Name the runner's engine knows the model by, when it differs.
  std::string local_name;

  [[nodiscard]] auto engine_model_name() const -> const std::string&
  {
    return local_name.empty() ? model_id : local_name;
  }
};

// Value copy of a runner's state. Only the registry holds the live record.
struct RunnerSnapshot {
  std::string runner_id;
  std::string connection;
  RunnerStatus status = RunnerStatus::Connecting;
  std::vector<ServedModel> models;
  Clock::time_point connected_at;
  Clock::time_point last_heartbeat_at;
  std::size_t in_flight = 0;

  [[nodiscard]] auto find_model(std::string_view model_id) const
      -> const ServedModel*;
};

// One routable model across every Ready runner that serves it.
struct ModelSummary {
  std::string model_id;
  std::size_t max_batch_size = 0;
  std::size_t runner_count = 0;
};

struct RunnerHandle {
  std::string runner_id;
};

enum class RunnerEventType : std::uint8_t { Registered, Draining, RunnerLost };

struct RunnerEvent {
  RunnerEventType type;
  std::string runner_id;
};

using RunnerEventListener = std::function<void(const RunnerEvent&)>;

// =============================================================================
// RunnerRegistry
// -----------------------------------------------------------------------------
// Tracks connected runners, what they serve and whether they are alive.
// Dependents learn about lost runners through subscribed listeners, which
// are always invoked outside the registry lock.
// =============================================================================
class RunnerRegistry {
 public:
  using SubscriptionId = std::uint64_t;

  explicit RunnerRegistry(
      std::chrono::milliseconds heartbeat_timeout,
      VerbosityLevel verbosity = VerbosityLevel::Silent);
  ~RunnerRegistry();
  RunnerRegistry(const RunnerRegistry&) = delete;
  auto operator=(const RunnerRegistry&) -> RunnerRegistry& = delete;
  RunnerRegistry(RunnerRegistry&&) = delete;
  auto operator=(RunnerRegistry&&) -> RunnerRegistry& = delete;

  auto register_runner(
      const std::string& runner_id, std::vector<ServedModel> models,
      std::string connection, Clock::time_point now = Clock::now())
      -> RunnerHandle;
  auto heartbeat(
      std::string_view runner_id, std::size_t current_load,
      Clock::time_point now = Clock::now()) -> bool;
  auto mark_draining(std::string_view runner_id) -> bool;
  auto mark_disconnected(std::string_view runner_id) -> bool;

  [[nodiscard]] auto candidates_for(std::string_view model_id) const
      -> std::vector<RunnerSnapshot>;
  [[nodiscard]] auto max_batch_size_for(std::string_view model_id) const
      -> std::optional<std::size_t>;
  [[nodiscard]] auto has_live_runner(std::string_view model_id) const -> bool;
  [[nodiscard]] auto find(std::string_view runner_id) const
      -> std::optional<RunnerSnapshot>;
  [[nodiscard]] auto list_runners() const -> std::vector<RunnerSnapshot>;
  /// Models served by Ready runners, sorted by id.
  [[nodiscard]] auto list_models() const -> std::vector<ModelSummary>;
  [[nodiscard]] auto size() const -> std::size_t;

  auto begin_dispatch(std::string_view runner_id) -> bool;
  void end_dispatch(std::string_view runner_id);

  auto sweep_stale(Clock::time_point now = Clock::now())
      -> std::vector<std::string>;
  void start_liveness_sweep(std::chrono::milliseconds interval);
  void stop_liveness_sweep();

  auto subscribe(RunnerEventListener listener) -> SubscriptionId;
  /// Blocks until deliveries already in progress finish, so the listener's
  /// captures may be destroyed afterwards. Must not be called from a
  /// listener.
  void unsubscribe(SubscriptionId subscription);

 private:
  using RunnerMap = StringMap<RunnerSnapshot>;

  void emit(const RunnerEvent& event);
  void publish_runner_count(std::size_t count) const;

  std::chrono::milliseconds heartbeat_timeout_;
  VerbosityLevel verbosity_;

  mutable std::shared_mutex mutex_;
  RunnerMap runners_;

  std::mutex listeners_mutex_;
  std::map<SubscriptionId, RunnerEventListener> listeners_;
  SubscriptionId next_subscription_ = 1;
  std::size_t active_emits_ = 0;
  std::condition_variable emits_done_;

  std::jthread sweeper_thread_;
};

}  // namespace inference_gateway
