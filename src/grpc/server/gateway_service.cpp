#include "gateway_service.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <format>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "grpc/common/proto_conversions.hpp"
#include "utils/exceptions.hpp"

namespace inference_gateway {
using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

auto
compute_thread_count_from(unsigned concurrency) -> std::size_t
{
  if (concurrency == 0U) {
    return kDefaultGrpcThreads;
  }
  return std::clamp<std::size_t>(concurrency, kMinGrpcThreads, kMaxGrpcThreads);
}

namespace {

auto
validate_chat_request(const proto::ChatCompletionRequest& request) -> Status
{
  if (request.model().empty()) {
    return {grpc::StatusCode::INVALID_ARGUMENT, "model is required"};
  }
  if (request.messages_size() == 0) {
    return {grpc::StatusCode::INVALID_ARGUMENT, "messages must not be empty"};
  }
  return Status::OK;
}

auto
unknown_runner(const std::string& runner_id) -> Status
{
  return {
      grpc::StatusCode::NOT_FOUND,
      std::format("runner {} is not registered", runner_id)};
}

}  // namespace

GatewayServiceImpl::GatewayServiceImpl(
    Router& router, RunnerRegistry& registry,
    std::chrono::milliseconds heartbeat_timeout, VerbosityLevel verbosity)
    : router_(&router), registry_(&registry),
      heartbeat_timeout_(heartbeat_timeout), verbosity_(verbosity)
{
}

auto
GatewayServiceImpl::ServerLive(
    ServerContext* /*context*/, const proto::ServerLiveRequest* /*request*/,
    proto::ServerLiveResponse* reply) -> Status
{
  reply->set_live(true);
  return Status::OK;
}

void
GatewayServiceImpl::HandleChatCompletionAsync(
    ServerContext* /*context*/, const proto::ChatCompletionRequest* request,
    proto::ChatCompletionResponse* reply,
    std::function<void(Status)> on_done)
{
  if (auto status = validate_chat_request(*request); !status.ok()) {
    on_done(std::move(status));
    return;
  }

  auto shared_done =
      std::make_shared<std::function<void(Status)>>(std::move(on_done));
  try {
    const auto request_id = router_->submit_async(
        to_core(*request), [reply, shared_done](RequestOutcome outcome) {
          if (outcome.ok()) {
            to_proto(*outcome.response, reply);
            (*shared_done)(Status::OK);
          } else {
            (*shared_done)(status_from_exception(outcome.error));
          }
        });
    log_trace(
        verbosity_, std::format("Accepted chat completion {}", request_id));
  }
  catch (const std::invalid_argument& e) {
    (*shared_done)(Status(grpc::StatusCode::INVALID_ARGUMENT, e.what()));
  }
}

auto
GatewayServiceImpl::ChatCompletion(
    ServerContext* context, const proto::ChatCompletionRequest* request,
    proto::ChatCompletionResponse* reply) -> Status
{
  std::promise<Status> status_promise;
  auto status_future = status_promise.get_future();
  HandleChatCompletionAsync(
      context, request, reply, [&status_promise](Status status) {
        status_promise.set_value(std::move(status));
      });
  return status_future.get();
}

auto
GatewayServiceImpl::CancelChatCompletion(
    ServerContext* /*context*/,
    const proto::CancelChatCompletionRequest* request,
    proto::CancelChatCompletionResponse* reply) -> Status
{
  if (request->request_id().empty()) {
    return {grpc::StatusCode::INVALID_ARGUMENT, "request_id is required"};
  }
  reply->set_cancelled(router_->cancel(request->request_id()));
  return Status::OK;
}

auto
GatewayServiceImpl::RegisterRunner(
    ServerContext* /*context*/, const proto::RegisterRunnerRequest* request,
    proto::RegisterRunnerResponse* reply) -> Status
{
  if (request->address().empty()) {
    return {grpc::StatusCode::INVALID_ARGUMENT, "runner address is required"};
  }
  std::vector<ServedModel> models;
  models.reserve(static_cast<std::size_t>(request->models_size()));
  for (const auto& model : request->models()) {
    models.push_back(to_core(model));
  }

  try {
    registry_->register_runner(
        request->runner_id(), std::move(models), request->address());
  }
  catch (const GatewayException& e) {
    log_warning(std::format(
        "Rejected registration of runner '{}': {}", request->runner_id(),
        e.what()));
    return status_from_exception(std::current_exception());
  }
  reply->set_runner_id(request->runner_id());
  reply->set_heartbeat_timeout_ms(
      static_cast<std::uint64_t>(heartbeat_timeout_.count()));
  return Status::OK;
}

auto
GatewayServiceImpl::Heartbeat(
    ServerContext* /*context*/, const proto::HeartbeatRequest* request,
    proto::HeartbeatResponse* /*reply*/) -> Status
{
  if (!registry_->heartbeat(request->runner_id(), request->current_load())) {
    return unknown_runner(request->runner_id());
  }
  return Status::OK;
}

auto
GatewayServiceImpl::DrainRunner(
    ServerContext* /*context*/, const proto::RunnerRequest* request,
    proto::RunnerResponse* /*reply*/) -> Status
{
  if (!registry_->mark_draining(request->runner_id())) {
    return unknown_runner(request->runner_id());
  }
  return Status::OK;
}

auto
GatewayServiceImpl::DisconnectRunner(
    ServerContext* /*context*/, const proto::RunnerRequest* request,
    proto::RunnerResponse* /*reply*/) -> Status
{
  if (!registry_->mark_disconnected(request->runner_id())) {
    return unknown_runner(request->runner_id());
  }
  return Status::OK;
}

auto
GatewayServiceImpl::ListRunners(
    ServerContext* /*context*/, const proto::ListRunnersRequest* /*request*/,
    proto::ListRunnersResponse* reply) -> Status
{
  const auto now = Clock::now();
  for (const auto& runner : router_->list_runners()) {
    to_proto(runner, now, reply->add_runners());
  }
  return Status::OK;
}

auto
GatewayServiceImpl::ListModels(
    ServerContext* /*context*/, const proto::ListModelsRequest* /*request*/,
    proto::ListModelsResponse* reply) -> Status
{
  for (const auto& model : router_->list_models()) {
    to_proto(model, reply->add_models());
  }
  return Status::OK;
}

auto
GatewayServiceImpl::QueueDepths(
    ServerContext* /*context*/, const proto::QueueDepthsRequest* /*request*/,
    proto::QueueDepthsResponse* reply) -> Status
{
  for (const auto& [model_id, depth] : router_->queue_depths()) {
    auto* entry = reply->add_queues();
    entry->set_model_id(model_id);
    entry->set_depth(depth);
  }
  return Status::OK;
}

namespace {

class AsyncCallDataBase {
 public:
  AsyncCallDataBase() = default;
  AsyncCallDataBase(const AsyncCallDataBase&) = delete;
  auto operator=(const AsyncCallDataBase&) -> AsyncCallDataBase& = delete;
  AsyncCallDataBase(AsyncCallDataBase&&) = default;
  auto operator=(AsyncCallDataBase&&) -> AsyncCallDataBase& = default;
  virtual ~AsyncCallDataBase() = default;
  virtual void Proceed(bool is_ok) = 0;
};

template <typename Request, typename Response>
class UnaryCallData final
    : public AsyncCallDataBase,
      public std::enable_shared_from_this<UnaryCallData<Request, Response>> {
 public:
  using Self = UnaryCallData<Request, Response>;
  using SharedPtr = std::shared_ptr<Self>;
  using RequestMethod = void (proto::GatewayService::AsyncService::*)(
      grpc::ServerContext*, Request*,
      grpc::ServerAsyncResponseWriter<Response>*, grpc::CompletionQueue*,
      grpc::ServerCompletionQueue*, void*);
  using Handler = std::function<grpc::Status(
      GatewayServiceImpl*, grpc::ServerContext*, const Request*, Response*)>;

  UnaryCallData(
      proto::GatewayService::AsyncService* service,
      grpc::ServerCompletionQueue* completion_queue, GatewayServiceImpl* impl,
      RequestMethod request_method, Handler handler)
      : service_(service), cq_(completion_queue), responder_(&ctx_),
        impl_(impl), request_method_(request_method),
        handler_(std::move(handler))
  {
  }

  static void Start(
      proto::GatewayService::AsyncService* service,
      grpc::ServerCompletionQueue* completion_queue, GatewayServiceImpl* impl,
      RequestMethod request_method, Handler handler)
  {
    auto call = std::make_shared<Self>(
        service, completion_queue, impl, request_method, std::move(handler));
    call->Proceed(true);
  }

  void Proceed(bool is_ok) override
  {
    switch (status_) {
      case CallStatus::Create: {
        status_ = CallStatus::Process;
        self_ref_ = this->shared_from_this();
        (service_->*request_method_)(
            &ctx_, &request_, &responder_, cq_, cq_, this);
        break;
      }
      case CallStatus::Process: {
        if (!is_ok) {
          status_ = CallStatus::Finish;
          self_ref_.reset();
          return;
        }
        Start(service_, cq_, impl_, request_method_, handler_);
        HandleRequest();
        break;
      }
      case CallStatus::Finish:
        self_ref_.reset();
        break;
    }
  }

 private:
  enum class CallStatus : std::uint8_t { Create, Process, Finish };

  void HandleRequest()
  {
    auto status = handler_(impl_, &ctx_, &request_, &response_);
    status_ = CallStatus::Finish;
    responder_.Finish(response_, status, this);
  }

  proto::GatewayService::AsyncService* service_;
  grpc::ServerCompletionQueue* cq_;
  grpc::ServerContext ctx_;
  Request request_;
  Response response_;
  grpc::ServerAsyncResponseWriter<Response> responder_;
  GatewayServiceImpl* impl_;
  RequestMethod request_method_;
  Handler handler_;
  CallStatus status_ = CallStatus::Create;
  SharedPtr self_ref_;
};

class ChatCompletionCallData final
    : public AsyncCallDataBase,
      public std::enable_shared_from_this<ChatCompletionCallData> {
 public:
  using Self = ChatCompletionCallData;
  using SharedPtr = std::shared_ptr<Self>;

  ChatCompletionCallData(
      proto::GatewayService::AsyncService* service,
      grpc::ServerCompletionQueue* completion_queue, GatewayServiceImpl* impl)
      : service_(service), cq_(completion_queue), responder_(&ctx_), impl_(impl)
  {
  }

  static void Start(
      proto::GatewayService::AsyncService* service,
      grpc::ServerCompletionQueue* completion_queue, GatewayServiceImpl* impl)
  {
    auto call = std::make_shared<Self>(service, completion_queue, impl);
    call->Proceed(true);
  }

  void Proceed(bool is_ok) override
  {
    using enum CallStatus;
    switch (status_) {
      case Create: {
        status_ = Process;
        self_ref_ = this->shared_from_this();
        service_->RequestChatCompletion(
            &ctx_, &request_, &responder_, cq_, cq_, this);
        break;
      }
      case Process: {
        if (!is_ok) {
          status_ = Finish;
          self_ref_.reset();
          return;
        }
        Start(service_, cq_, impl_);
        auto self = this->shared_from_this();
        impl_->HandleChatCompletionAsync(
            &ctx_, &request_, &response_,
            [self = std::move(self)](const Status& status) {
              self->OnCompletion(status);
            });
        break;
      }
      case Finish:
        self_ref_.reset();
        break;
    }
  }

 private:
  enum class CallStatus : std::uint8_t { Create, Process, Finish };

  void OnCompletion(const Status& status)
  {
    status_ = CallStatus::Finish;
    responder_.Finish(response_, status, this);
  }

  proto::GatewayService::AsyncService* service_;
  grpc::ServerCompletionQueue* cq_;
  grpc::ServerContext ctx_;
  proto::ChatCompletionRequest request_;
  proto::ChatCompletionResponse response_;
  grpc::ServerAsyncResponseWriter<proto::ChatCompletionResponse> responder_;
  GatewayServiceImpl* impl_;
  CallStatus status_ = CallStatus::Create;
  SharedPtr self_ref_;
};

template <typename Request, typename Response>
void
start_unary(
    proto::GatewayService::AsyncService* service,
    grpc::ServerCompletionQueue* completion_queue, GatewayServiceImpl* impl,
    typename UnaryCallData<Request, Response>::RequestMethod request_method,
    typename UnaryCallData<Request, Response>::Handler handler)
{
  UnaryCallData<Request, Response>::Start(
      service, completion_queue, impl, request_method, std::move(handler));
}

auto
compute_thread_count() -> std::size_t
{
  return compute_thread_count_from(std::thread::hardware_concurrency());
}

}  // namespace

AsyncServerContext::AsyncServerContext(
    proto::GatewayService::AsyncService& async_service,
    GatewayServiceImpl& impl)
    : async_service_(&async_service), impl_(&impl)
{
}

void
AsyncServerContext::configure(grpc::ServerBuilder& builder)
{
  builder.RegisterService(async_service_);
  completion_queue_ = builder.AddCompletionQueue();
}

void
AsyncServerContext::start()
{
  if (!completion_queue_ || started_) {
    return;
  }
  started_ = true;
  const std::size_t thread_count = compute_thread_count();
  threads_.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this]() { this->poll_events(); });
  }

  using Service = proto::GatewayService::AsyncService;
  auto* cq = completion_queue_.get();
  start_unary<proto::ServerLiveRequest, proto::ServerLiveResponse>(
      async_service_, cq, impl_, &Service::RequestServerLive,
      std::mem_fn(&GatewayServiceImpl::ServerLive));
  start_unary<
      proto::CancelChatCompletionRequest, proto::CancelChatCompletionResponse>(
      async_service_, cq, impl_, &Service::RequestCancelChatCompletion,
      std::mem_fn(&GatewayServiceImpl::CancelChatCompletion));
  start_unary<proto::RegisterRunnerRequest, proto::RegisterRunnerResponse>(
      async_service_, cq, impl_, &Service::RequestRegisterRunner,
      std::mem_fn(&GatewayServiceImpl::RegisterRunner));
  start_unary<proto::HeartbeatRequest, proto::HeartbeatResponse>(
      async_service_, cq, impl_, &Service::RequestHeartbeat,
      std::mem_fn(&GatewayServiceImpl::Heartbeat));
  start_unary<proto::RunnerRequest, proto::RunnerResponse>(
      async_service_, cq, impl_, &Service::RequestDrainRunner,
      std::mem_fn(&GatewayServiceImpl::DrainRunner));
  start_unary<proto::RunnerRequest, proto::RunnerResponse>(
      async_service_, cq, impl_, &Service::RequestDisconnectRunner,
      std::mem_fn(&GatewayServiceImpl::DisconnectRunner));
  start_unary<proto::ListRunnersRequest, proto::ListRunnersResponse>(
      async_service_, cq, impl_, &Service::RequestListRunners,
      std::mem_fn(&GatewayServiceImpl::ListRunners));
  start_unary<proto::ListModelsRequest, proto::ListModelsResponse>(
      async_service_, cq, impl_, &Service::RequestListModels,
      std::mem_fn(&GatewayServiceImpl::ListModels));
  start_unary<proto::QueueDepthsRequest, proto::QueueDepthsResponse>(
      async_service_, cq, impl_, &Service::RequestQueueDepths,
      std::mem_fn(&GatewayServiceImpl::QueueDepths));
  ChatCompletionCallData::Start(async_service_, cq, impl_);
}

void
AsyncServerContext::shutdown()
{
  if (!started_) {
    return;
  }
  started_ = false;
  if (completion_queue_) {
    completion_queue_->Shutdown();
  }
  threads_.clear();
  completion_queue_.reset();
}

auto
AsyncServerContext::started() const -> bool
{
  return started_;
}

auto
AsyncServerContext::thread_count() const -> std::size_t
{
  return threads_.size();
}

void
AsyncServerContext::poll_events()
{
  void* tag = nullptr;
  bool event_ok = false;
  while (completion_queue_ && completion_queue_->Next(&tag, &event_ok)) {
    static_cast<AsyncCallDataBase*>(tag)->Proceed(event_ok);
  }
}

namespace {
auto
configure_server_builder(
    grpc::ServerBuilder& builder, const GrpcServerOptions& options) -> void
{
  builder.AddListeningPort(options.address, grpc::InsecureServerCredentials());
  const int grpc_max_message_bytes =
      options.max_message_bytes >
              static_cast<std::size_t>(std::numeric_limits<int>::max())
          ? std::numeric_limits<int>::max()
          : static_cast<int>(options.max_message_bytes);
  builder.SetMaxReceiveMessageSize(grpc_max_message_bytes);
  builder.SetMaxSendMessageSize(grpc_max_message_bytes);
}
}  // namespace

void
RunGrpcServer(
    GatewayServiceImpl& service, const GrpcServerOptions& options,
    std::unique_ptr<Server>& server)
{
  proto::GatewayService::AsyncService async_service;
  AsyncServerContext async_context(async_service, service);

  ServerBuilder builder;
  configure_server_builder(builder, options);
  async_context.configure(builder);

  server = builder.BuildAndStart();
  if (!server) {
    log_error(
        std::format("Failed to start gRPC server on {}", options.address));
    return;
  }
  async_context.start();
  log_info(
      options.verbosity,
      std::format("Gateway listening on {}", options.address));
  server->Wait();
  async_context.shutdown();
  server.reset();
}

void
StopServer(Server* server)
{
  if (server != nullptr) {
    server->Shutdown();
  }
}
}  // namespace inference_gateway
