#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/router.hpp"
#include "core/runner_registry.hpp"
#include "gateway.grpc.pb.h"
#include "utils/logger.hpp"

namespace inference_gateway {

class GatewayServiceImpl final : public proto::GatewayService::Service {
 public:
  GatewayServiceImpl(
      Router& router, RunnerRegistry& registry,
      std::chrono::milliseconds heartbeat_timeout,
      VerbosityLevel verbosity = VerbosityLevel::Silent);

  auto ServerLive(
      grpc::ServerContext* context, const proto::ServerLiveRequest* request,
      proto::ServerLiveResponse* reply) -> grpc::Status override;

  auto ChatCompletion(
      grpc::ServerContext* context, const proto::ChatCompletionRequest* request,
      proto::ChatCompletionResponse* reply) -> grpc::Status override;

  auto CancelChatCompletion(
      grpc::ServerContext* context,
      const proto::CancelChatCompletionRequest* request,
      proto::CancelChatCompletionResponse* reply) -> grpc::Status override;

  auto RegisterRunner(
      grpc::ServerContext* context, const proto::RegisterRunnerRequest* request,
      proto::RegisterRunnerResponse* reply) -> grpc::Status override;

  auto Heartbeat(
      grpc::ServerContext* context, const proto::HeartbeatRequest* request,
      proto::HeartbeatResponse* reply) -> grpc::Status override;

  auto DrainRunner(
      grpc::ServerContext* context, const proto::RunnerRequest* request,
      proto::RunnerResponse* reply) -> grpc::Status override;

  auto DisconnectRunner(
      grpc::ServerContext* context, const proto::RunnerRequest* request,
      proto::RunnerResponse* reply) -> grpc::Status override;

  auto ListRunners(
      grpc::ServerContext* context, const proto::ListRunnersRequest* request,
      proto::ListRunnersResponse* reply) -> grpc::Status override;

  auto ListModels(
      grpc::ServerContext* context, const proto::ListModelsRequest* request,
      proto::ListModelsResponse* reply) -> grpc::Status override;

  auto QueueDepths(
      grpc::ServerContext* context, const proto::QueueDepthsRequest* request,
      proto::QueueDepthsResponse* reply) -> grpc::Status override;

  /// Completes through on_done exactly once, possibly on another thread.
  void HandleChatCompletionAsync(
      grpc::ServerContext* context, const proto::ChatCompletionRequest* request,
      proto::ChatCompletionResponse* reply,
      std::function<void(grpc::Status)> on_done);

 private:
  Router* router_;
  RunnerRegistry* registry_;
  std::chrono::milliseconds heartbeat_timeout_;
  VerbosityLevel verbosity_;
};

class AsyncServerContext {
 public:
  AsyncServerContext(
      proto::GatewayService::AsyncService& async_service,
      GatewayServiceImpl& impl);

  void configure(grpc::ServerBuilder& builder);
  void start();
  void shutdown();

  [[nodiscard]] auto started() const -> bool;
  [[nodiscard]] auto thread_count() const -> std::size_t;

 private:
  void poll_events();

  proto::GatewayService::AsyncService* async_service_;
  GatewayServiceImpl* impl_;
  std::unique_ptr<grpc::ServerCompletionQueue> completion_queue_;
  std::vector<std::jthread> threads_;
  bool started_ = false;
};

inline constexpr std::size_t kDefaultGrpcThreads = 4;
inline constexpr std::size_t kMinGrpcThreads = 2;
inline constexpr std::size_t kMaxGrpcThreads = 8;

auto compute_thread_count_from(unsigned concurrency) -> std::size_t;

struct GrpcServerOptions {
  std::string address;
  std::size_t max_message_bytes;
  VerbosityLevel verbosity;
};

void RunGrpcServer(
    GatewayServiceImpl& service, const GrpcServerOptions& options,
    std::unique_ptr<grpc::Server>& server);

void StopServer(grpc::Server* server);
}  // namespace inference_gateway
