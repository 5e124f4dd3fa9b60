#include "grpc_runner_executor.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "grpc/common/proto_conversions.hpp"
#include "utils/exceptions.hpp"

namespace inference_gateway {
struct AsyncRunnerCall {
  std::uint64_t call_id = 0;
  std::string runner_id;
  std::size_t request_count = 0;
  proto::ExecuteBatchResponse reply;
  grpc::ClientContext context;
  grpc::Status status;
  std::unique_ptr<grpc::ClientAsyncResponseReader<proto::ExecuteBatchResponse>>
      response_reader = nullptr;
  ExecutionCallback callback;
};

namespace {

auto
to_execution_result(const AsyncRunnerCall& call) -> ExecutionResult
{
  ExecutionResult result;
  if (!call.status.ok()) {
    result.error = exception_from_status(call.status, call.runner_id);
    return result;
  }
  result.items.reserve(static_cast<std::size_t>(call.reply.results_size()));
  for (const auto& item : call.reply.results()) {
    ExecutionItemResult converted;
    if (item.has_response()) {
      converted.response = to_core(item.response());
    } else if (item.has_error()) {
      converted.error = item.error();
    } else {
      converted.error = "runner returned an empty result";
    }
    result.items.push_back(std::move(converted));
  }
  return result;
}

void
invoke_callback(const ExecutionCallback& callback, ExecutionResult result)
{
  try {
    callback(std::move(result));
  }
  catch (const std::exception& e) {
    log_error(std::format("Execution callback threw: {}", e.what()));
  }
}

}  // namespace

GrpcRunnerExecutor::GrpcRunnerExecutor(GrpcRunnerExecutorOptions options)
    : options_(options)
{
}

GrpcRunnerExecutor::~GrpcRunnerExecutor()
{
  shutdown();
}

void
GrpcRunnerExecutor::start()
{
  const std::scoped_lock lock(mutex_);
  if (started_ || shutting_down_) {
    return;
  }
  started_ = true;
  cq_thread_ = std::jthread([this]() { complete_rpcs(); });
}

void
GrpcRunnerExecutor::shutdown()
{
  {
    const std::scoped_lock lock(mutex_);
    if (shutting_down_) {
      return;
    }
    shutting_down_ = true;
    for (const auto& [call_id, call] : calls_) {
      call->context.TryCancel();
    }
  }
  cq_.Shutdown();
  if (cq_thread_.joinable()) {
    cq_thread_.join();
  } else {
    // Never started: drain the queue here so pending callbacks still run.
    complete_rpcs();
  }
}

auto
GrpcRunnerExecutor::stub_for(const std::string& address)
    -> proto::InferenceRunner::Stub*
{
  if (const auto found = stubs_.find(address); found != stubs_.end()) {
    return found->second.get();
  }
  const int max_bytes = static_cast<int>(std::min<std::size_t>(
      options_.max_message_bytes,
      static_cast<std::size_t>(std::numeric_limits<int>::max())));
  grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(max_bytes);
  args.SetMaxSendMessageSize(max_bytes);
  auto channel = grpc::CreateCustomChannel(
      address, grpc::InsecureChannelCredentials(), args);
  auto [entry, inserted] = stubs_.emplace(
      address, proto::InferenceRunner::NewStub(std::move(channel)));
  return entry->second.get();
}

void
GrpcRunnerExecutor::execute(
    ExecutionRequest request, ExecutionCallback callback)
{
  proto::ExecuteBatchRequest wire;
  wire.set_call_id(request.call_id);
  wire.set_model(request.engine_model_name);
  for (const auto& item : request.requests) {
    to_proto(item, wire.add_requests());
  }

  auto call = std::make_unique<AsyncRunnerCall>();
  call->call_id = request.call_id;
  call->runner_id = request.runner_id;
  call->request_count = request.requests.size();
  call->callback = std::move(callback);
  call->context.set_deadline(
      std::chrono::system_clock::now() + options_.execution_timeout);

  {
    const std::scoped_lock lock(mutex_);
    if (!shutting_down_) {
      auto* stub = stub_for(request.connection);
      call->response_reader =
          stub->AsyncExecuteBatch(&call->context, wire, &cq_);
      call->response_reader->Finish(&call->reply, &call->status, call.get());
      calls_.emplace(call->call_id, call.get());
      log_trace(
          options_.verbosity,
          std::format(
              "ExecuteBatch call {} sent to {} ({} request(s))",
              call->call_id, request.connection, call->request_count));
      [[maybe_unused]] auto* released_call = call.release();
      return;
    }
  }

  ExecutionResult result;
  result.error = std::make_exception_ptr(
      CancelledException("runner executor is shutting down"));
  invoke_callback(call->callback, std::move(result));
}

void
GrpcRunnerExecutor::cancel(std::uint64_t call_id)
{
  const std::scoped_lock lock(mutex_);
  if (const auto found = calls_.find(call_id); found != calls_.end()) {
    found->second->context.TryCancel();
  }
}

auto
GrpcRunnerExecutor::outstanding_calls() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return calls_.size();
}

void
GrpcRunnerExecutor::complete_rpcs()
{
  void* got_tag = nullptr;
  bool event_ok = false;
  while (cq_.Next(&got_tag, &event_ok)) {
    auto call = std::unique_ptr<AsyncRunnerCall>(
        static_cast<AsyncRunnerCall*>(got_tag));
    {
      const std::scoped_lock lock(mutex_);
      calls_.erase(call->call_id);
    }
    if (!event_ok && call->status.ok()) {
      call->status = grpc::Status(
          grpc::StatusCode::UNAVAILABLE, "completion queue reported failure");
    }
    if (!call->status.ok()) {
      log_debug(
          options_.verbosity,
          std::format(
              "ExecuteBatch call {} to {} failed: {}", call->call_id,
              call->runner_id, call->status.error_message()));
    }
    invoke_callback(call->callback, to_execution_result(*call));
  }
}

}  // namespace inference_gateway
