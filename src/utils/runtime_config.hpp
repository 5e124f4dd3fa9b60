#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "logger.hpp"

namespace inference_gateway {
// =============================================================================
// Compile-time defaults
// =============================================================================
inline constexpr std::size_t kBytesPerKiB = 1024ULL;
inline constexpr std::size_t kBytesPerMiB = kBytesPerKiB * 1024ULL;
inline constexpr std::size_t kDefaultMaxMessageBytes = 16ULL * kBytesPerMiB;
inline constexpr int kDefaultMetricsPort = 9090;
inline constexpr auto kDefaultBatchTimeout = std::chrono::milliseconds(50);
inline constexpr std::size_t kDefaultMinBatchSize = 1;
inline constexpr auto kDefaultDispatchTick = std::chrono::milliseconds(10);
inline constexpr auto kDefaultNoRunnerTimeout =
    std::chrono::milliseconds(30000);
inline constexpr auto kDefaultHeartbeatTimeout =
    std::chrono::milliseconds(90000);
inline constexpr auto kDefaultLivenessSweep = std::chrono::milliseconds(1000);
inline constexpr auto kDefaultExecutionTimeout =
    std::chrono::milliseconds(300000);

// =============================================================================
// BatchQueueConfig
// -----------------------------------------------------------------------------
// Batch admission parameters, read-only once the queue is built.
// =============================================================================
struct BatchQueueConfig {
  std::chrono::milliseconds batch_timeout = kDefaultBatchTimeout;
  std::size_t min_batch_size = kDefaultMinBatchSize;
};

// =============================================================================
// RuntimeConfig
// -----------------------------------------------------------------------------
// Global configuration of the gateway process.
//
// Contains:
//   - Network settings (gRPC address, metrics port, message limit)
//   - Batching settings (admission, dispatcher tick, no-runner timeout)
//   - Runner liveness settings
//   - Model class lists used to resolve "class:fast" / "class:big"
//   - Logging level
// =============================================================================
struct RuntimeConfig {
  struct BatchingSettings {
    bool enabled = true;
    BatchQueueConfig queue{};
    std::chrono::milliseconds dispatch_tick = kDefaultDispatchTick;
    std::chrono::milliseconds no_runner_timeout = kDefaultNoRunnerTimeout;
  };

  struct RunnerSettings {
    std::chrono::milliseconds heartbeat_timeout = kDefaultHeartbeatTimeout;
    std::chrono::milliseconds liveness_sweep = kDefaultLivenessSweep;
    std::chrono::milliseconds execution_timeout = kDefaultExecutionTimeout;
  };

  struct ModelClasses {
    std::vector<std::string> fast;
    std::vector<std::string> big;
  };

  std::string config_path;
  std::string server_address = "127.0.0.1:50051";
  int metrics_port = kDefaultMetricsPort;
  std::size_t max_message_bytes = kDefaultMaxMessageBytes;

  VerbosityLevel verbosity = VerbosityLevel::Silent;
  BatchingSettings batching{};
  RunnerSettings runners{};
  ModelClasses model_classes{};
  bool valid = true;
};

}  // namespace inference_gateway
