#include "proto_conversions.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>

#include "utils/exceptions.hpp"

namespace inference_gateway {

auto
to_core(const proto::ChatCompletionRequest& request) -> ChatCompletionRequest
{
  ChatCompletionRequest out;
  out.request_id = request.request_id();
  out.model = request.model();
  out.messages.reserve(static_cast<std::size_t>(request.messages_size()));
  for (const auto& message : request.messages()) {
    out.messages.push_back(ChatMessage{message.role(), message.content()});
  }
  if (request.has_temperature()) {
    out.temperature = request.temperature();
  }
  if (request.has_max_tokens()) {
    out.max_tokens = request.max_tokens();
  }
  out.stream = request.stream();
  return out;
}

void
to_proto(
    const ChatCompletionRequest& request, proto::ChatCompletionRequest* out)
{
  out->set_request_id(request.request_id);
  out->set_model(request.model);
  for (const auto& message : request.messages) {
    auto* wire = out->add_messages();
    wire->set_role(message.role);
    wire->set_content(message.content);
  }
  if (request.temperature.has_value()) {
    out->set_temperature(*request.temperature);
  }
  if (request.max_tokens.has_value()) {
    out->set_max_tokens(*request.max_tokens);
  }
  out->set_stream(request.stream);
}

auto
to_core(const proto::ChatCompletionResponse& response) -> ChatCompletionResponse
{
  ChatCompletionResponse out;
  out.request_id = response.request_id();
  out.model = response.model();
  out.runner_id = response.runner_id();
  out.message = ChatMessage{
      response.message().role(), response.message().content()};
  out.finish_reason = response.finish_reason();
  out.usage.prompt_tokens = response.usage().prompt_tokens();
  out.usage.completion_tokens = response.usage().completion_tokens();
  return out;
}

void
to_proto(
    const ChatCompletionResponse& response, proto::ChatCompletionResponse* out)
{
  out->set_request_id(response.request_id);
  out->set_model(response.model);
  out->set_runner_id(response.runner_id);
  out->mutable_message()->set_role(response.message.role);
  out->mutable_message()->set_content(response.message.content);
  out->set_finish_reason(response.finish_reason);
  out->mutable_usage()->set_prompt_tokens(response.usage.prompt_tokens);
  out->mutable_usage()->set_completion_tokens(
      response.usage.completion_tokens);
}

auto
to_core(const proto::ServedModel& model) -> ServedModel
{
  ServedModel out;
  out.model_id = model.model_id();
  out.max_batch_size = model.max_batch_size();
  out.engine_type = model.engine_type();
  out.local_name = model.local_name();
  return out;
}

void
to_proto(const ServedModel& model, proto::ServedModel* out)
{
  out->set_model_id(model.model_id);
  out->set_max_batch_size(static_cast<std::uint32_t>(model.max_batch_size));
  out->set_engine_type(model.engine_type);
  out->set_local_name(model.local_name);
}

void
to_proto(
    const RunnerSnapshot& runner, Clock::time_point now, proto::RunnerInfo* out)
{
  out->set_runner_id(runner.runner_id);
  out->set_address(runner.connection);
  out->set_status(std::string(to_string(runner.status)));
  for (const auto& model : runner.models) {
    to_proto(model, out->add_models());
  }
  out->set_in_flight(runner.in_flight);
  const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
      now - runner.last_heartbeat_at);
  out->set_last_heartbeat_age_ms(
      age.count() < 0 ? 0U : static_cast<std::uint64_t>(age.count()));
}

void
to_proto(const ModelSummary& model, proto::ModelInfo* out)
{
  out->set_model_id(model.model_id);
  out->set_max_batch_size(static_cast<std::uint32_t>(model.max_batch_size));
  out->set_runner_count(static_cast<std::uint32_t>(model.runner_count));
}

auto
status_from_exception(const std::exception_ptr& error) -> grpc::Status
{
  if (!error) {
    return grpc::Status::OK;
  }
  try {
    std::rethrow_exception(error);
  }
  catch (const RequestFailedException& e) {
    using enum GatewayErrorKind;
    switch (e.kind()) {
      case ModelUnavailable:
        return {grpc::StatusCode::UNAVAILABLE, e.what()};
      case RunnerLost:
        return {grpc::StatusCode::ABORTED, e.what()};
      case ExecutionFailed:
        return {grpc::StatusCode::INTERNAL, e.what()};
      case QueueTimeout:
        return {grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
      case Cancelled:
        return {grpc::StatusCode::CANCELLED, e.what()};
    }
    return {grpc::StatusCode::UNKNOWN, e.what()};
  }
  catch (const DuplicateRunnerException& e) {
    return {grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  catch (const InvalidRunnerRegistrationException& e) {
    return {grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  catch (const std::invalid_argument& e) {
    return {grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  catch (const std::exception& e) {
    return {grpc::StatusCode::INTERNAL, e.what()};
  }
}

auto
exception_from_status(const grpc::Status& status, std::string_view runner_id)
    -> std::exception_ptr
{
  const auto message = std::format(
      "runner {} call failed: {}", runner_id, status.error_message());
  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return std::make_exception_ptr(RunnerLostException(message));
    case grpc::StatusCode::CANCELLED:
      return std::make_exception_ptr(CancelledException(message));
    default:
      return std::make_exception_ptr(ExecutionFailedException(message));
  }
}

}  // namespace inference_gateway
