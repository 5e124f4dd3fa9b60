#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "chat_types.hpp"

namespace inference_gateway {

using Clock = std::chrono::steady_clock;

// =============================================================================
// RequestOutcome
// -----------------------------------------------------------------------------
// Terminal state of one request: either a response or an exception deriving
// from RequestFailedException.
// =============================================================================
struct RequestOutcome {
  std::optional<ChatCompletionResponse> response;
  std::exception_ptr error;

  [[nodiscard]] auto ok() const -> bool { return response.has_value(); }

  static auto success(ChatCompletionResponse value) -> RequestOutcome;
  static auto failure(std::exception_ptr error) -> RequestOutcome;
};

using ResultCallback = std::function<void(RequestOutcome)>;

// =============================================================================
// ResultSink
// -----------------------------------------------------------------------------
// Single-use completion slot. The first resolve() wins and runs the callback;
// every later call returns false without side effects.
// =============================================================================
class ResultSink {
 public:
  explicit ResultSink(ResultCallback callback);

  auto resolve(RequestOutcome outcome) -> bool;
  [[nodiscard]] auto resolved() const -> bool;

 private:
  mutable std::mutex mutex_;
  ResultCallback callback_;
  bool consumed_ = false;
};

// =============================================================================
// QueuedRequest
// -----------------------------------------------------------------------------
// One caller's unit of work. Immutable after creation; only its sink changes
// state, once.
// =============================================================================
class QueuedRequest {
 public:
  QueuedRequest(
      std::string model_id, ChatCompletionRequest payload,
      ResultCallback on_complete, Clock::time_point enqueued_at = Clock::now());

  [[nodiscard]] auto request_id() const -> const std::string&
  {
    return payload_.request_id;
  }
  [[nodiscard]] auto model_id() const -> const std::string&
  {
    return model_id_;
  }
  [[nodiscard]] auto payload() const -> const ChatCompletionRequest&
  {
    return payload_;
  }
  [[nodiscard]] auto enqueued_at() const -> Clock::time_point
  {
    return enqueued_at_;
  }

  auto resolve(RequestOutcome outcome) -> bool;
  auto succeed(ChatCompletionResponse response) -> bool;
  template <typename Exception>
  auto fail(const std::string& message) -> bool
  {
    return resolve(RequestOutcome::failure(
        std::make_exception_ptr(Exception(message))));
  }
  [[nodiscard]] auto resolved() const -> bool { return sink_.resolved(); }

 private:
  std::string model_id_;
  ChatCompletionRequest payload_;
  Clock::time_point enqueued_at_;
  ResultSink sink_;
};

using QueuedRequestPtr = std::shared_ptr<QueuedRequest>;

}  // namespace inference_gateway
