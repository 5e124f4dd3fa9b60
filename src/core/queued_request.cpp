#include "queued_request.hpp"

#include <exception>
#include <string>
#include <utility>

#include "utils/logger.hpp"

namespace inference_gateway {

auto
RequestOutcome::success(ChatCompletionResponse value) -> RequestOutcome
{
  RequestOutcome outcome;
  outcome.response = std::move(value);
  return outcome;
}

auto
RequestOutcome::failure(std::exception_ptr error) -> RequestOutcome
{
  RequestOutcome outcome;
  outcome.error = std::move(error);
  return outcome;
}

ResultSink::ResultSink(ResultCallback callback) : callback_(std::move(callback))
{
}

auto
ResultSink::resolve(RequestOutcome outcome) -> bool
{
  ResultCallback callback;
  {
    const std::scoped_lock lock(mutex_);
    if (consumed_) {
      return false;
    }
    consumed_ = true;
    callback = std::move(callback_);
  }
  if (!callback) {
    return true;
  }
  try {
    callback(std::move(outcome));
  }
  catch (const std::exception& e) {
    log_error(std::string("Result callback threw: ") + e.what());
  }
  return true;
}

auto
ResultSink::resolved() const -> bool
{
  const std::scoped_lock lock(mutex_);
  return consumed_;
}

QueuedRequest::QueuedRequest(
    std::string model_id, ChatCompletionRequest payload,
    ResultCallback on_complete, Clock::time_point enqueued_at)
    : model_id_(std::move(model_id)), payload_(std::move(payload)),
      enqueued_at_(enqueued_at), sink_(std::move(on_complete))
{
}

auto
QueuedRequest::resolve(RequestOutcome outcome) -> bool
{
  return sink_.resolve(std::move(outcome));
}

auto
QueuedRequest::succeed(ChatCompletionResponse response) -> bool
{
  return resolve(RequestOutcome::success(std::move(response)));
}

}  // namespace inference_gateway
