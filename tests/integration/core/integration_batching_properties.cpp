#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <thread>
#include <vector>

#include "core/router.hpp"
#include "support/fake_runner_executor.hpp"
#include "support/outcome_recorder.hpp"
#include "test_helpers.hpp"

using namespace inference_gateway;
using namespace std::chrono_literals;

namespace {

struct GatewayCore {
  GatewayCore(
      BatchQueueConfig queue_config, DispatcherSettings settings,
      FakeRunnerExecutor::Mode mode)
      : queue(queue_config), executor(mode),
        dispatcher(queue, registry, executor, settings),
        router(registry, queue, dispatcher, RouterSettings{})
  {
    dispatcher.start();
  }
  ~GatewayCore()
  {
    router.shutdown();
    dispatcher.stop();
  }
  GatewayCore(const GatewayCore&) = delete;
  auto operator=(const GatewayCore&) -> GatewayCore& = delete;
  GatewayCore(GatewayCore&&) = delete;
  auto operator=(GatewayCore&&) -> GatewayCore& = delete;

  void add_runner(
      const std::string& runner_id, const std::string& model_id,
      std::size_t max_batch_size)
  {
    registry.register_runner(
        runner_id, {make_served_model(model_id, max_batch_size)},
        runner_id + ":7000");
  }

  void submit(
      OutcomeRecorder& outcomes, const std::string& model_id,
      const std::string& request_id)
  {
    router.submit_async(
        make_chat_request(model_id, "prompt " + request_id, request_id),
        outcomes.callback(request_id));
  }

  RunnerRegistry registry{60s};
  BatchQueue queue;
  FakeRunnerExecutor executor;
  BatchDispatcher dispatcher;
  Router router;
};

auto
dispatched_ids(const std::vector<ExecutionRequest>& calls)
    -> std::vector<std::string>
{
  std::vector<std::string> ids;
  for (const auto& call : calls) {
    for (const auto& request : call.requests) {
      ids.push_back(request.request_id);
    }
  }
  return ids;
}

}  // namespace

TEST(BatchingProperties, FifoOrderWithinModel)
{
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{10ms, 3}, DispatcherSettings{2ms, 10s},
      FakeRunnerExecutor::Mode::Echo);
  core.add_runner("r1", "llama", 3);

  std::vector<std::string> expected;
  for (int i = 0; i < 10; ++i) {
    expected.push_back(std::format("req-{:02}", i));
    core.submit(outcomes, "llama", expected.back());
  }
  ASSERT_TRUE(outcomes.wait_for(expected.size()));
  EXPECT_EQ(dispatched_ids(core.executor.calls()), expected);
  for (const auto& call : core.executor.calls()) {
    EXPECT_LE(call.requests.size(), 3U);
  }
}

TEST(BatchingProperties, SizeTriggerDispatchesBeforeTimeout)
{
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{10s, 4}, DispatcherSettings{1s, 60s},
      FakeRunnerExecutor::Mode::Echo);
  core.add_runner("r1", "llama", 8);

  const auto start = Clock::now();
  for (const auto* id : {"a", "b", "c", "d"}) {
    core.submit(outcomes, "llama", id);
  }
  ASSERT_TRUE(outcomes.wait_for(4, 900ms));
  EXPECT_LT(Clock::now() - start, 900ms);
  ASSERT_EQ(core.executor.calls().size(), 1U);
  EXPECT_EQ(core.executor.calls()[0].requests.size(), 4U);
}

TEST(BatchingProperties, TimeoutTriggerFlushesPartialBatch)
{
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{40ms, 8}, DispatcherSettings{5ms, 60s},
      FakeRunnerExecutor::Mode::Echo);
  core.add_runner("r1", "llama", 8);

  const auto start = Clock::now();
  core.submit(outcomes, "llama", "lonely");
  ASSERT_TRUE(outcomes.wait_for(1));
  EXPECT_GE(Clock::now() - start, 40ms);
  EXPECT_TRUE(outcomes.outcome("lonely")->ok());
}

TEST(BatchingProperties, UnservedModelTimesOut)
{
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{10ms, 1}, DispatcherSettings{5ms, 60ms},
      FakeRunnerExecutor::Mode::Echo);

  CaptureStream capture{std::cerr};
  const auto start = Clock::now();
  core.submit(outcomes, "ghost", "g1");
  ASSERT_TRUE(outcomes.wait_for(1));
  EXPECT_GE(Clock::now() - start, 60ms);
  EXPECT_EQ(outcomes.error_kind("g1"), GatewayErrorKind::QueueTimeout);
}

TEST(BatchingProperties, UnservedModelDoesNotBlockOthers)
{
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{10ms, 1}, DispatcherSettings{5ms, 10s},
      FakeRunnerExecutor::Mode::Echo);
  core.add_runner("r1", "llama", 4);

  core.submit(outcomes, "ghost", "stuck");
  for (const auto* id : {"a", "b", "c"}) {
    core.submit(outcomes, "llama", id);
  }
  ASSERT_TRUE(outcomes.wait_for(3));
  EXPECT_EQ(outcomes.count("stuck"), 0U);
  for (const auto& call : core.executor.calls()) {
    EXPECT_EQ(call.model_id, "llama");
  }
  EXPECT_EQ(core.queue.pending_count("ghost"), 1U);
}

TEST(BatchingProperties, StalledRunnerDoesNotDelayOtherModels)
{
  constexpr int kBacklog = 12;
  constexpr int kOthers = 6;
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{5ms, 2}, DispatcherSettings{2ms, 10s},
      FakeRunnerExecutor::Mode::Echo);
  core.add_runner("stalled", "llama", 2);
  core.add_runner("healthy", "mistral", 2);
  core.executor.set_runner_mode("stalled", FakeRunnerExecutor::Mode::Manual);

  for (int i = 0; i < kBacklog; ++i) {
    core.submit(outcomes, "llama", std::format("a{}", i));
  }
  for (int i = 0; i < kOthers; ++i) {
    core.submit(outcomes, "mistral", std::format("b{}", i));
  }

  ASSERT_TRUE(outcomes.wait_for(kOthers));
  for (int i = 0; i < kOthers; ++i) {
    const auto outcome = outcomes.outcome(std::format("b{}", i));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->ok());
  }
  for (int i = 0; i < kBacklog; ++i) {
    EXPECT_EQ(outcomes.count(std::format("a{}", i)), 0U);
  }

  const auto stalled_requests = [&core] {
    std::size_t count = 0;
    for (const auto& call : core.executor.calls()) {
      if (call.model_id == "llama") {
        count += call.requests.size();
      }
    }
    return count;
  };
  ASSERT_TRUE(wait_until([&] {
    return stalled_requests() == static_cast<std::size_t>(kBacklog);
  }));

  std::size_t stalled_calls = 0;
  for (const auto& call : core.executor.calls()) {
    if (call.model_id == "llama") {
      EXPECT_EQ(call.runner_id, "stalled");
      ++stalled_calls;
    } else {
      EXPECT_EQ(call.runner_id, "healthy");
    }
  }
  EXPECT_GT(stalled_calls, 0U);
  EXPECT_EQ(core.executor.pending_ids().size(), stalled_calls);
  EXPECT_EQ(outcomes.total(), static_cast<std::size_t>(kOthers));
}

TEST(BatchingProperties, RunnerLossFailsOnlyItsBatch)
{
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{10ms, 1}, DispatcherSettings{5ms, 10s},
      FakeRunnerExecutor::Mode::Manual);
  core.add_runner("r1", "llama", 2);
  core.add_runner("r2", "llama", 2);

  for (const auto* id : {"a", "b", "c", "d"}) {
    core.submit(outcomes, "llama", id);
  }
  ASSERT_TRUE(core.executor.wait_for_calls(2));
  const auto calls = core.executor.calls();
  const auto lost =
      std::ranges::find_if(calls, [](const ExecutionRequest& call) {
        return call.runner_id == "r2";
      });
  ASSERT_NE(lost, calls.end());

  CaptureStream capture{std::cerr};
  ASSERT_TRUE(core.registry.mark_disconnected("r2"));
  ASSERT_TRUE(outcomes.wait_for(lost->requests.size()));
  for (const auto& request : lost->requests) {
    EXPECT_EQ(
        outcomes.error_kind(request.request_id), GatewayErrorKind::RunnerLost);
  }
  core.executor.complete_all();
  ASSERT_TRUE(outcomes.wait_for(4));
  EXPECT_TRUE(outcomes.each_resolved_once());
  EXPECT_EQ(outcomes.total(), 4U);
}

TEST(BatchingProperties, EveryRequestResolvesExactlyOnceUnderChurn)
{
  constexpr int kRequests = 200;
  OutcomeRecorder outcomes;
  GatewayCore core(
      BatchQueueConfig{2ms, 4}, DispatcherSettings{1ms, 50ms},
      FakeRunnerExecutor::Mode::Manual);
  core.add_runner("r1", "llama", 4);
  core.add_runner("r2", "llama", 4);

  CaptureStream capture{std::cerr};
  std::jthread completer([&](const std::stop_token& stop) {
    while (!stop.stop_requested()) {
      core.executor.complete_all();
      std::this_thread::sleep_for(1ms);
    }
  });

  bool cancelled = false;
  const auto cancelled_id = std::format("c{}", kRequests / 2);
  for (int i = 0; i < kRequests; ++i) {
    core.submit(outcomes, "llama", std::format("c{}", i));
    if (i == kRequests / 3) {
      ASSERT_TRUE(core.registry.mark_disconnected("r1"));
    }
    if (i == kRequests / 2) {
      cancelled = core.router.cancel(cancelled_id);
    }
  }

  ASSERT_TRUE(outcomes.wait_for(kRequests, 5s));
  completer.request_stop();
  completer.join();
  core.executor.complete_all();

  EXPECT_EQ(outcomes.total(), static_cast<std::size_t>(kRequests));
  EXPECT_TRUE(outcomes.each_resolved_once());
  EXPECT_EQ(core.router.pending_requests(), 0U);
  if (cancelled) {
    EXPECT_EQ(outcomes.error_kind(cancelled_id), GatewayErrorKind::Cancelled);
  }
}
