#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "chat_types.hpp"

namespace inference_gateway {

struct ExecutionRequest {
  std::uint64_t call_id = 0;
  std::string runner_id;
  std::string connection;
  std::string model_id;
  // Model name as the runner's engine knows it.
  std::string engine_model_name;
  std::vector<ChatCompletionRequest> requests;
};

struct ExecutionItemResult {
  std::optional<ChatCompletionResponse> response;
  std::string error;
};

// Either one result per request, in request order, or a batch-level error.
struct ExecutionResult {
  std::vector<ExecutionItemResult> items;
  std::exception_ptr error;
};

using ExecutionCallback = std::function<void(ExecutionResult)>;

// =============================================================================
// RunnerExecutor
// -----------------------------------------------------------------------------
// Sends one batch to one runner. execute() must not block on runner I/O and
// must invoke the callback exactly once, possibly from another thread or
// before execute() returns. Batch-level failures are reported as
// RequestFailedException subclasses in ExecutionResult::error.
// =============================================================================
class RunnerExecutor {
 public:
  RunnerExecutor() = default;
  RunnerExecutor(const RunnerExecutor&) = delete;
  auto operator=(const RunnerExecutor&) -> RunnerExecutor& = delete;
  RunnerExecutor(RunnerExecutor&&) = delete;
  auto operator=(RunnerExecutor&&) -> RunnerExecutor& = delete;
  virtual ~RunnerExecutor() = default;

  virtual void execute(
      ExecutionRequest request, ExecutionCallback callback) = 0;
  /// Best effort; unknown or finished calls are ignored.
  virtual void cancel(std::uint64_t call_id) = 0;
};

}  // namespace inference_gateway
