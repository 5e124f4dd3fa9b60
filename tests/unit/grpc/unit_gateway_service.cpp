#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

#include "grpc/server/gateway_service.hpp"
#include "support/fake_runner_executor.hpp"
#include "test_helpers.hpp"

using namespace inference_gateway;
using namespace std::chrono_literals;

namespace {

auto
make_wire_request(
    const std::string& model, const std::string& content,
    const std::string& request_id = {}) -> proto::ChatCompletionRequest
{
  proto::ChatCompletionRequest request;
  request.set_request_id(request_id);
  request.set_model(model);
  if (!content.empty()) {
    auto* message = request.add_messages();
    message->set_role("user");
    message->set_content(content);
  }
  return request;
}

auto
make_registration(
    const std::string& runner_id, const std::string& address,
    std::uint32_t max_batch_size = 4) -> proto::RegisterRunnerRequest
{
  proto::RegisterRunnerRequest request;
  request.set_runner_id(runner_id);
  request.set_address(address);
  auto* model = request.add_models();
  model->set_model_id("llama");
  model->set_max_batch_size(max_batch_size);
  model->set_engine_type("vllm");
  return request;
}

class GatewayServiceTest : public ::testing::Test {
 protected:
  explicit GatewayServiceTest(bool batching_enabled = false)
      : router(
            registry, queue, dispatcher,
            RouterSettings{batching_enabled, RuntimeConfig::ModelClasses{}}),
        service(router, registry, 90s)
  {
  }

  void TearDown() override { dispatcher.stop(); }

  auto register_runner(const std::string& runner_id) -> grpc::Status
  {
    const auto request = make_registration(runner_id, runner_id + ":7000");
    proto::RegisterRunnerResponse reply;
    return service.RegisterRunner(nullptr, &request, &reply);
  }

  RunnerRegistry registry{90s};
  BatchQueue queue{BatchQueueConfig{50ms, 4}};
  FakeRunnerExecutor executor{FakeRunnerExecutor::Mode::Echo};
  BatchDispatcher dispatcher{queue, registry, executor, DispatcherSettings{}};
  Router router;
  GatewayServiceImpl service;
};

class BatchedGatewayServiceTest : public GatewayServiceTest {
 protected:
  BatchedGatewayServiceTest() : GatewayServiceTest(true) {}
};

}  // namespace

TEST_F(GatewayServiceTest, ServerLiveReportsLive)
{
  proto::ServerLiveRequest request;
  proto::ServerLiveResponse reply;
  ASSERT_TRUE(service.ServerLive(nullptr, &request, &reply).ok());
  EXPECT_TRUE(reply.live());
}

TEST_F(GatewayServiceTest, ChatCompletionRequiresModelAndMessages)
{
  proto::ChatCompletionResponse reply;
  const auto no_model = make_wire_request("", "hi");
  EXPECT_EQ(
      service.ChatCompletion(nullptr, &no_model, &reply).error_code(),
      grpc::StatusCode::INVALID_ARGUMENT);
  const auto no_messages = make_wire_request("llama", "");
  EXPECT_EQ(
      service.ChatCompletion(nullptr, &no_messages, &reply).error_code(),
      grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(GatewayServiceTest, ChatCompletionWithoutRunnerIsUnavailable)
{
  const auto request = make_wire_request("llama", "hi");
  proto::ChatCompletionResponse reply;
  EXPECT_EQ(
      service.ChatCompletion(nullptr, &request, &reply).error_code(),
      grpc::StatusCode::UNAVAILABLE);
}

TEST_F(GatewayServiceTest, ChatCompletionReturnsRunnerAnswer)
{
  ASSERT_TRUE(register_runner("r1").ok());
  const auto request = make_wire_request("llama", "hi", "chat-1");
  proto::ChatCompletionResponse reply;
  ASSERT_TRUE(service.ChatCompletion(nullptr, &request, &reply).ok());
  EXPECT_EQ(reply.request_id(), "chat-1");
  EXPECT_EQ(reply.model(), "llama");
  EXPECT_EQ(reply.runner_id(), "r1");
  EXPECT_EQ(reply.message().content(), "echo:hi");
}

TEST_F(GatewayServiceTest, RegisterRunnerRepliesWithHeartbeatTimeout)
{
  const auto request = make_registration("r1", "10.0.0.1:7000");
  proto::RegisterRunnerResponse reply;
  ASSERT_TRUE(service.RegisterRunner(nullptr, &request, &reply).ok());
  EXPECT_EQ(reply.runner_id(), "r1");
  EXPECT_EQ(reply.heartbeat_timeout_ms(), 90000U);
  EXPECT_EQ(registry.find("r1")->connection, "10.0.0.1:7000");
}

TEST_F(GatewayServiceTest, RegisterRunnerRejections)
{
  ASSERT_TRUE(register_runner("r1").ok());

  CaptureStream capture{std::cerr};
  EXPECT_EQ(
      register_runner("r1").error_code(), grpc::StatusCode::ALREADY_EXISTS);
  EXPECT_EQ(
      capture.str(),
      expected_log_line(
          WarningLevel,
          "Rejected registration of runner 'r1': runner r1 is already "
          "registered"));

  proto::RegisterRunnerResponse reply;
  const auto no_address = make_registration("r2", "");
  EXPECT_EQ(
      service.RegisterRunner(nullptr, &no_address, &reply).error_code(),
      grpc::StatusCode::INVALID_ARGUMENT);
  const auto zero_batch = make_registration("r3", "x:1", 0);
  EXPECT_EQ(
      service.RegisterRunner(nullptr, &zero_batch, &reply).error_code(),
      grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(GatewayServiceTest, HeartbeatDrainAndDisconnect)
{
  ASSERT_TRUE(register_runner("r1").ok());
  proto::HeartbeatRequest heartbeat;
  heartbeat.set_runner_id("r1");
  heartbeat.set_current_load(5);
  proto::HeartbeatResponse heartbeat_reply;
  ASSERT_TRUE(service.Heartbeat(nullptr, &heartbeat, &heartbeat_reply).ok());
  EXPECT_EQ(registry.find("r1")->in_flight, 5U);

  proto::RunnerRequest runner;
  runner.set_runner_id("r1");
  proto::RunnerResponse reply;
  ASSERT_TRUE(service.DrainRunner(nullptr, &runner, &reply).ok());
  EXPECT_EQ(registry.find("r1")->status, RunnerStatus::Draining);
  ASSERT_TRUE(service.DisconnectRunner(nullptr, &runner, &reply).ok());
  EXPECT_FALSE(registry.find("r1").has_value());

  EXPECT_EQ(
      service.Heartbeat(nullptr, &heartbeat, &heartbeat_reply).error_code(),
      grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(
      service.DrainRunner(nullptr, &runner, &reply).error_code(),
      grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(
      service.DisconnectRunner(nullptr, &runner, &reply).error_code(),
      grpc::StatusCode::NOT_FOUND);
}

TEST_F(GatewayServiceTest, ListRunnersDescribesEachRunner)
{
  ASSERT_TRUE(register_runner("r2").ok());
  ASSERT_TRUE(register_runner("r1").ok());
  proto::ListRunnersRequest request;
  proto::ListRunnersResponse reply;
  ASSERT_TRUE(service.ListRunners(nullptr, &request, &reply).ok());
  ASSERT_EQ(reply.runners_size(), 2);
  EXPECT_EQ(reply.runners(0).runner_id(), "r1");
  EXPECT_EQ(reply.runners(0).status(), "ready");
  EXPECT_EQ(reply.runners(0).models(0).model_id(), "llama");
  EXPECT_EQ(reply.runners(1).address(), "r2:7000");
}

TEST_F(GatewayServiceTest, ListModelsReportsLargestBatchPerModel)
{
  ASSERT_TRUE(register_runner("r1").ok());
  const auto request = make_registration("r2", "r2:7000", 16);
  proto::RegisterRunnerResponse registered;
  ASSERT_TRUE(service.RegisterRunner(nullptr, &request, &registered).ok());

  proto::ListModelsRequest list;
  proto::ListModelsResponse reply;
  ASSERT_TRUE(service.ListModels(nullptr, &list, &reply).ok());
  ASSERT_EQ(reply.models_size(), 1);
  EXPECT_EQ(reply.models(0).model_id(), "llama");
  EXPECT_EQ(reply.models(0).max_batch_size(), 16U);
  EXPECT_EQ(reply.models(0).runner_count(), 2U);

  proto::RunnerRequest drain;
  drain.set_runner_id("r2");
  proto::RunnerResponse drained;
  ASSERT_TRUE(service.DrainRunner(nullptr, &drain, &drained).ok());
  reply.Clear();
  ASSERT_TRUE(service.ListModels(nullptr, &list, &reply).ok());
  ASSERT_EQ(reply.models_size(), 1);
  EXPECT_EQ(reply.models(0).max_batch_size(), 4U);
  EXPECT_EQ(reply.models(0).runner_count(), 1U);
}

TEST_F(GatewayServiceTest, CancelRequiresRequestId)
{
  proto::CancelChatCompletionRequest request;
  proto::CancelChatCompletionResponse reply;
  EXPECT_EQ(
      service.CancelChatCompletion(nullptr, &request, &reply).error_code(),
      grpc::StatusCode::INVALID_ARGUMENT);
  request.set_request_id("unknown");
  ASSERT_TRUE(service.CancelChatCompletion(nullptr, &request, &reply).ok());
  EXPECT_FALSE(reply.cancelled());
}

TEST_F(BatchedGatewayServiceTest, AsyncCompletionWaitsForBatch)
{
  ASSERT_TRUE(register_runner("r1").ok());
  const auto request = make_wire_request("llama", "hi", "b1");
  proto::ChatCompletionResponse reply;
  std::optional<grpc::Status> status;
  service.HandleChatCompletionAsync(
      nullptr, &request, &reply,
      [&status](grpc::Status done) { status = std::move(done); });
  EXPECT_FALSE(status.has_value());

  proto::QueueDepthsRequest depths_request;
  proto::QueueDepthsResponse depths;
  ASSERT_TRUE(service.QueueDepths(nullptr, &depths_request, &depths).ok());
  ASSERT_EQ(depths.queues_size(), 1);
  EXPECT_EQ(depths.queues(0).model_id(), "llama");
  EXPECT_EQ(depths.queues(0).depth(), 1U);

  dispatcher.run_cycle(Clock::now() + 1s);
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(status->ok());
  EXPECT_EQ(reply.message().content(), "echo:hi");
}

TEST_F(BatchedGatewayServiceTest, CancelQueuedCompletion)
{
  const auto request = make_wire_request("llama", "hi", "b2");
  proto::ChatCompletionResponse reply;
  std::optional<grpc::Status> status;
  service.HandleChatCompletionAsync(
      nullptr, &request, &reply,
      [&status](grpc::Status done) { status = std::move(done); });

  proto::CancelChatCompletionRequest cancel;
  cancel.set_request_id("b2");
  proto::CancelChatCompletionResponse cancel_reply;
  ASSERT_TRUE(
      service.CancelChatCompletion(nullptr, &cancel, &cancel_reply).ok());
  EXPECT_TRUE(cancel_reply.cancelled());
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->error_code(), grpc::StatusCode::CANCELLED);
}

TEST_F(BatchedGatewayServiceTest, DuplicatePendingIdIsInvalidArgument)
{
  const auto request = make_wire_request("llama", "hi", "dup");
  proto::ChatCompletionResponse first_reply;
  proto::ChatCompletionResponse second_reply;
  std::optional<grpc::Status> first;
  std::optional<grpc::Status> second;
  service.HandleChatCompletionAsync(
      nullptr, &request, &first_reply,
      [&first](grpc::Status done) { first = std::move(done); });
  service.HandleChatCompletionAsync(
      nullptr, &request, &second_reply,
      [&second](grpc::Status done) { second = std::move(done); });
  EXPECT_FALSE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(GatewayService, ComputeThreadCountClampsConcurrency)
{
  EXPECT_EQ(compute_thread_count_from(0), kDefaultGrpcThreads);
  EXPECT_EQ(compute_thread_count_from(1), kMinGrpcThreads);
  EXPECT_EQ(compute_thread_count_from(6), 6U);
  EXPECT_EQ(compute_thread_count_from(64), kMaxGrpcThreads);
}
