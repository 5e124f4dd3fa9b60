#include "monitoring/metrics.hpp"

#include <prometheus/exposer.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>

#include <atomic>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <utility>

#include "utils/logger.hpp"

namespace inference_gateway {

class PrometheusExposerHandle : public MetricsRegistry::ExposerHandle {
 public:
  explicit PrometheusExposerHandle(std::unique_ptr<prometheus::Exposer> exposer)
      : exposer_(std::move(exposer))
  {
  }

  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RegisterCollectable(collectable);
  }

  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RemoveCollectable(collectable);
  }

 private:
  std::unique_ptr<prometheus::Exposer> exposer_;
};

namespace {

const prometheus::Histogram::BucketBoundaries kBatchSizeBuckets{
    1, 2, 4, 8, 16, 32, 64, 128};

const prometheus::Histogram::BucketBoundaries kQueueWaitMsBuckets{
    1, 5, 10, 25, 50, 100, 250, 500, 1000, 5000};

}  // namespace

MetricsRegistry::MetricsRegistry(
    int port, std::unique_ptr<ExposerHandle> exposer_handle)
    : registry(std::make_shared<prometheus::Registry>())
{
  initialize(port, std::move(exposer_handle));
}

void
MetricsRegistry::initialize(
    int port, std::unique_ptr<ExposerHandle> exposer_handle)
{
  try {
    if (!exposer_handle) {
      auto exposer = std::make_unique<prometheus::Exposer>(
          std::format("0.0.0.0:{}", port));
      exposer_handle =
          std::make_unique<PrometheusExposerHandle>(std::move(exposer));
    }
    exposer_handle->RegisterCollectable(registry);
    exposer_ = std::move(exposer_handle);
  }
  catch (const std::exception& e) {
    log_error(std::string("Failed to initialize metrics exposer: ") + e.what());
    throw;
  }

  requests_family = &prometheus::BuildCounter()
                         .Name("requests_total")
                         .Help("Chat completion requests received, by path")
                         .Register(*registry);

  outcomes_family = &prometheus::BuildCounter()
                         .Name("request_outcomes_total")
                         .Help("Resolved requests, by outcome kind")
                         .Register(*registry);

  auto& batches_family = prometheus::BuildCounter()
                             .Name("batches_dispatched_total")
                             .Help("Batches handed to a runner")
                             .Register(*registry);
  batches_dispatched = &batches_family.Add({});

  auto& batch_size_family = prometheus::BuildHistogram()
                                .Name("batch_size")
                                .Help("Number of requests per dispatched batch")
                                .Register(*registry);
  batch_size = &batch_size_family.Add({}, kBatchSizeBuckets);

  auto& queue_wait_family =
      prometheus::BuildHistogram()
          .Name("queue_wait_ms")
          .Help("Time a request spent queued before dispatch, in ms")
          .Register(*registry);
  queue_wait_ms = &queue_wait_family.Add({}, kQueueWaitMsBuckets);

  model_queue_depth_family = &prometheus::BuildGauge()
                                  .Name("model_queue_depth")
                                  .Help("Pending requests per model queue")
                                  .Register(*registry);

  auto& runners_family = prometheus::BuildGauge()
                             .Name("runners_registered")
                             .Help("Runners currently registered")
                             .Register(*registry);
  runners_registered = &runners_family.Add({});
}

MetricsRegistry::~MetricsRegistry() noexcept
{
  if (exposer_ && registry) {
    try {
      exposer_->RemoveCollectable(registry);
    }
    catch (const std::exception& e) {
      log_error(
          std::string("Failed to remove metrics registry collectable: ") +
          e.what());
    }
  }
}

namespace {
auto
metrics_atomic() -> std::atomic<std::shared_ptr<MetricsRegistry>>&
{
  static std::atomic<std::shared_ptr<MetricsRegistry>> instance{nullptr};
  return instance;
}
}  // namespace

auto
init_metrics(
    int port, std::unique_ptr<MetricsRegistry::ExposerHandle> exposer_handle)
    -> bool
{
  std::shared_ptr<MetricsRegistry> expected{nullptr};

  try {
    auto new_metrics =
        std::make_shared<MetricsRegistry>(port, std::move(exposer_handle));

    if (!metrics_atomic().compare_exchange_strong(
            expected, new_metrics, std::memory_order_acq_rel,
            std::memory_order_acquire)) {
      log_warning("Metrics were previously initialized");
      return false;
    }

    set_runners_registered(0);
    return true;
  }
  catch (const std::exception& e) {
    log_error(std::string("Metrics initialization failed: ") + e.what());
    return false;
  }
}

void
shutdown_metrics()
{
  metrics_atomic().store(nullptr, std::memory_order_release);
}

auto
get_metrics() -> std::shared_ptr<MetricsRegistry>
{
  return metrics_atomic().load(std::memory_order_acquire);
}

void
record_request(std::string_view path)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->requests_family != nullptr) {
    metrics_ptr->requests_family->Add({{"path", std::string(path)}})
        .Increment();
  }
}

void
record_outcome(std::string_view kind)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->outcomes_family != nullptr) {
    metrics_ptr->outcomes_family->Add({{"kind", std::string(kind)}})
        .Increment();
  }
}

void
record_batch_dispatched(std::size_t size)
{
  auto metrics_ptr = get_metrics();
  if (!metrics_ptr) {
    return;
  }
  if (metrics_ptr->batches_dispatched != nullptr) {
    metrics_ptr->batches_dispatched->Increment();
  }
  if (metrics_ptr->batch_size != nullptr) {
    metrics_ptr->batch_size->Observe(static_cast<double>(size));
  }
}

void
observe_queue_wait_ms(double wait_ms)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->queue_wait_ms != nullptr) {
    metrics_ptr->queue_wait_ms->Observe(wait_ms);
  }
}

void
set_model_queue_depth(std::string_view model_id, std::size_t depth)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->model_queue_depth_family != nullptr) {
    metrics_ptr->model_queue_depth_family
        ->Add({{"model", std::string(model_id)}})
        .Set(static_cast<double>(depth));
  }
}

void
set_runners_registered(std::size_t count)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->runners_registered != nullptr) {
    metrics_ptr->runners_registered->Set(static_cast<double>(count));
  }
}

}  // namespace inference_gateway
