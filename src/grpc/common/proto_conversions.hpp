#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>
#include <string_view>

#include "core/chat_types.hpp"
#include "core/queued_request.hpp"
#include "core/runner_registry.hpp"
#include "gateway.pb.h"

namespace inference_gateway {

// =============================================================================
// Wire <-> core conversions shared by the gateway service and the runner
// executor.
// =============================================================================

auto to_core(const proto::ChatCompletionRequest& request)
    -> ChatCompletionRequest;
void to_proto(
    const ChatCompletionRequest& request, proto::ChatCompletionRequest* out);

auto to_core(const proto::ChatCompletionResponse& response)
    -> ChatCompletionResponse;
void to_proto(
    const ChatCompletionResponse& response, proto::ChatCompletionResponse* out);

auto to_core(const proto::ServedModel& model) -> ServedModel;
void to_proto(const ServedModel& model, proto::ServedModel* out);

void to_proto(
    const RunnerSnapshot& runner, Clock::time_point now,
    proto::RunnerInfo* out);
void to_proto(const ModelSummary& model, proto::ModelInfo* out);

/// Maps a request failure to the status reported to the client.
auto status_from_exception(const std::exception_ptr& error) -> grpc::Status;

/// Maps a failed runner call to the failure every batch member receives.
auto exception_from_status(
    const grpc::Status& status, std::string_view runner_id)
    -> std::exception_ptr;

}  // namespace inference_gateway
