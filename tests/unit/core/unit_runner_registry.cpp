#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <vector>

#include "core/runner_registry.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace inference_gateway;
using namespace std::chrono_literals;

namespace {
auto
runner_ids(const std::vector<RunnerSnapshot>& runners)
    -> std::vector<std::string>
{
  std::vector<std::string> ids;
  for (const auto& runner : runners) {
    ids.push_back(runner.runner_id);
  }
  return ids;
}
}  // namespace

TEST(RunnerRegistry, RegisterMakesRunnerReady)
{
  RunnerRegistry registry(1s);
  const auto handle = registry.register_runner(
      "r1", {make_served_model("llama", 8)}, "127.0.0.1:7001");
  EXPECT_EQ(handle.runner_id, "r1");

  const auto runner = registry.find("r1");
  ASSERT_TRUE(runner.has_value());
  EXPECT_EQ(runner->status, RunnerStatus::Ready);
  EXPECT_EQ(runner->connection, "127.0.0.1:7001");
  EXPECT_EQ(runner->in_flight, 0U);
  EXPECT_EQ(registry.size(), 1U);
}

TEST(RunnerRegistry, DuplicateIdRejected)
{
  RunnerRegistry registry(1s);
  registry.register_runner("r1", {make_served_model("llama", 8)}, "a");
  EXPECT_THROW(
      registry.register_runner("r1", {make_served_model("llama", 8)}, "b"),
      DuplicateRunnerException);
  EXPECT_EQ(registry.find("r1")->connection, "a");
}

TEST(RunnerRegistry, CandidatesOrderedByLoadThenId)
{
  RunnerRegistry registry(1s);
  registry.register_runner("r2", {make_served_model("llama", 4)}, "a");
  registry.register_runner("r1", {make_served_model("llama", 4)}, "b");
  registry.register_runner("r3", {make_served_model("mistral", 4)}, "c");

  EXPECT_EQ(
      runner_ids(registry.candidates_for("llama")),
      (std::vector<std::string>{"r1", "r2"}));

  ASSERT_TRUE(registry.begin_dispatch("r1"));
  EXPECT_EQ(
      runner_ids(registry.candidates_for("llama")),
      (std::vector<std::string>{"r2", "r1"}));

  registry.end_dispatch("r1");
  EXPECT_EQ(registry.find("r1")->in_flight, 0U);
  registry.end_dispatch("r1");
  EXPECT_EQ(registry.find("r1")->in_flight, 0U);
}

TEST(RunnerRegistry, DrainingRunnerIsNoCandidate)
{
  RunnerRegistry registry(1s);
  registry.register_runner("r1", {make_served_model("llama", 4)}, "a");
  EXPECT_TRUE(registry.mark_draining("r1"));
  EXPECT_TRUE(registry.mark_draining("r1"));
  EXPECT_TRUE(registry.candidates_for("llama").empty());
  EXPECT_FALSE(registry.has_live_runner("llama"));
  EXPECT_EQ(registry.find("r1")->status, RunnerStatus::Draining);
  EXPECT_FALSE(registry.mark_draining("unknown"));
}

TEST(RunnerRegistry, MaxBatchSizeIsLargestAmongReadyRunners)
{
  RunnerRegistry registry(1s);
  EXPECT_FALSE(registry.max_batch_size_for("llama").has_value());
  registry.register_runner("r1", {make_served_model("llama", 4)}, "a");
  registry.register_runner("r2", {make_served_model("llama", 16)}, "b");
  EXPECT_EQ(registry.max_batch_size_for("llama"), 16U);
  registry.mark_draining("r2");
  EXPECT_EQ(registry.max_batch_size_for("llama"), 4U);
}

TEST(RunnerRegistry, HeartbeatUpdatesLoadAndTimestamp)
{
  RunnerRegistry registry(1s);
  const auto t0 = Clock::now();
  registry.register_runner("r1", {make_served_model("llama", 4)}, "a", t0);
  EXPECT_TRUE(registry.heartbeat("r1", 3, t0 + 500ms));
  const auto runner = registry.find("r1");
  EXPECT_EQ(runner->in_flight, 3U);
  EXPECT_EQ(runner->last_heartbeat_at, t0 + 500ms);
  EXPECT_FALSE(registry.heartbeat("unknown", 0));
}

TEST(RunnerRegistry, SweepEvictsStaleRunnersAndEmitsLost)
{
  RunnerRegistry registry(100ms);
  std::vector<std::string> lost;
  registry.subscribe([&](const RunnerEvent& event) {
    if (event.type == RunnerEventType::RunnerLost) {
      lost.push_back(event.runner_id);
    }
  });

  const auto t0 = Clock::now();
  registry.register_runner("stale", {make_served_model("llama", 4)}, "a", t0);
  registry.register_runner("fresh", {make_served_model("llama", 4)}, "b", t0);
  registry.heartbeat("fresh", 0, t0 + 90ms);

  CaptureStream capture{std::cerr};
  const auto evicted = registry.sweep_stale(t0 + 150ms);
  EXPECT_EQ(evicted, (std::vector<std::string>{"stale"}));
  EXPECT_EQ(lost, (std::vector<std::string>{"stale"}));
  EXPECT_FALSE(registry.find("stale").has_value());
  EXPECT_TRUE(registry.find("fresh").has_value());
  EXPECT_EQ(
      capture.str(),
      expected_log_line(
          WarningLevel, "Evicting runner stale: no heartbeat within 100 ms"));
}

TEST(RunnerRegistry, DisconnectRemovesRunnerAndEmitsLost)
{
  RunnerRegistry registry(1s);
  std::vector<RunnerEventType> events;
  const auto subscription = registry.subscribe(
      [&](const RunnerEvent& event) { events.push_back(event.type); });

  registry.register_runner("r1", {make_served_model("llama", 4)}, "a");
  EXPECT_TRUE(registry.mark_disconnected("r1"));
  EXPECT_FALSE(registry.mark_disconnected("r1"));
  EXPECT_FALSE(registry.begin_dispatch("r1"));
  EXPECT_EQ(
      events, (std::vector<RunnerEventType>{
                  RunnerEventType::Registered, RunnerEventType::RunnerLost}));

  registry.unsubscribe(subscription);
  registry.register_runner("r2", {make_served_model("llama", 4)}, "a");
  EXPECT_EQ(events.size(), 2U);
}

TEST(RunnerRegistry, ListRunnersSortedById)
{
  RunnerRegistry registry(1s);
  registry.register_runner("b", {make_served_model("llama", 4)}, "x");
  registry.register_runner("a", {make_served_model("llama", 4)}, "y");
  EXPECT_EQ(
      runner_ids(registry.list_runners()),
      (std::vector<std::string>{"a", "b"}));
}

TEST(RunnerRegistry, UnsubscribeWaitsForDeliveryInProgress)
{
  RunnerRegistry registry(1s);
  registry.register_runner("r1", {make_served_model("llama", 4)}, "a");

  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();
  const auto subscription =
      registry.subscribe([&entered, released](const RunnerEvent& event) {
        if (event.type == RunnerEventType::RunnerLost) {
          entered.set_value();
          released.wait();
        }
      });

  auto disconnect = std::async(
      std::launch::async, [&registry] { registry.mark_disconnected("r1"); });
  entered.get_future().wait();

  auto unsubscribed = std::async(std::launch::async, [&] {
    registry.unsubscribe(subscription);
  });
  EXPECT_EQ(unsubscribed.wait_for(50ms), std::future_status::timeout);

  release.set_value();
  EXPECT_EQ(unsubscribed.wait_for(2s), std::future_status::ready);
  disconnect.get();
  unsubscribed.get();
}

TEST(RunnerRegistry, ListModelsMergesReadyRunners)
{
  RunnerRegistry registry(1s);
  registry.register_runner(
      "r1", {make_served_model("llama", 4), make_served_model("mistral", 2)},
      "a");
  registry.register_runner("r2", {make_served_model("llama", 16)}, "b");
  registry.register_runner("r3", {make_served_model("qwen", 8)}, "c");
  ASSERT_TRUE(registry.mark_draining("r3"));

  const auto models = registry.list_models();
  ASSERT_EQ(models.size(), 2U);
  EXPECT_EQ(models[0].model_id, "llama");
  EXPECT_EQ(models[0].max_batch_size, 16U);
  EXPECT_EQ(models[0].runner_count, 2U);
  EXPECT_EQ(models[1].model_id, "mistral");
  EXPECT_EQ(models[1].max_batch_size, 2U);
  EXPECT_EQ(models[1].runner_count, 1U);
}

TEST(RunnerRegistry, ListModelsEmptyWithoutReadyRunners)
{
  RunnerRegistry registry(1s);
  EXPECT_TRUE(registry.list_models().empty());
  registry.register_runner("r1", {make_served_model("llama", 4)}, "a");
  ASSERT_TRUE(registry.mark_disconnected("r1"));
  EXPECT_TRUE(registry.list_models().empty());
}

TEST(RunnerRegistry, EngineModelNameFallsBackToModelId)
{
  EXPECT_EQ(make_served_model("llama", 1).engine_model_name(), "llama");
  EXPECT_EQ(
      make_served_model("llama", 1, "llama-3-8b").engine_model_name(),
      "llama-3-8b");
}

TEST(RunnerRegistry, StatusNames)
{
  EXPECT_EQ(to_string(RunnerStatus::Connecting), "connecting");
  EXPECT_EQ(to_string(RunnerStatus::Ready), "ready");
  EXPECT_EQ(to_string(RunnerStatus::Draining), "draining");
  EXPECT_EQ(to_string(RunnerStatus::Disconnected), "disconnected");
}
