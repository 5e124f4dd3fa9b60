#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "core/runner_executor.hpp"
#include "gateway.grpc.pb.h"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"
#include "utils/transparent_hash.hpp"

namespace inference_gateway {
struct AsyncRunnerCall;

struct GrpcRunnerExecutorOptions {
  std::chrono::milliseconds execution_timeout = kDefaultExecutionTimeout;
  std::size_t max_message_bytes = kDefaultMaxMessageBytes;
  VerbosityLevel verbosity = VerbosityLevel::Silent;
};

// =============================================================================
// GrpcRunnerExecutor
// -----------------------------------------------------------------------------
// Calls InferenceRunner.ExecuteBatch on the runner's advertised address.
// Calls are asynchronous on one completion queue drained by a single thread;
// completion callbacks run on that thread. Channels are cached per address.
// =============================================================================
class GrpcRunnerExecutor final : public RunnerExecutor {
 public:
  explicit GrpcRunnerExecutor(GrpcRunnerExecutorOptions options);
  ~GrpcRunnerExecutor() override;
  GrpcRunnerExecutor(const GrpcRunnerExecutor&) = delete;
  auto operator=(const GrpcRunnerExecutor&) -> GrpcRunnerExecutor& = delete;
  GrpcRunnerExecutor(GrpcRunnerExecutor&&) = delete;
  auto operator=(GrpcRunnerExecutor&&) -> GrpcRunnerExecutor& = delete;

  void start();
  /// Cancels outstanding calls and waits until their callbacks have run.
  void shutdown();

  void execute(ExecutionRequest request, ExecutionCallback callback) override;
  void cancel(std::uint64_t call_id) override;

  [[nodiscard]] auto outstanding_calls() const -> std::size_t;

 private:
  auto stub_for(const std::string& address) -> proto::InferenceRunner::Stub*;
  void complete_rpcs();

  GrpcRunnerExecutorOptions options_;
  grpc::CompletionQueue cq_;
  std::jthread cq_thread_;

  mutable std::mutex mutex_;
  StringMap<std::unique_ptr<proto::InferenceRunner::Stub>> stubs_;
  std::unordered_map<std::uint64_t, AsyncRunnerCall*> calls_;
  bool started_ = false;
  bool shutting_down_ = false;
};

}  // namespace inference_gateway
