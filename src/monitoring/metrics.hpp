#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <cstddef>
#include <memory>
#include <string_view>

namespace prometheus {
class Collectable;
template <typename T>
class Family;
}  // namespace prometheus

namespace inference_gateway {

class MetricsRegistry {
 public:
  struct ExposerHandle {
    ExposerHandle() = default;
    ExposerHandle(const ExposerHandle&) = delete;
    auto operator=(const ExposerHandle&) -> ExposerHandle& = delete;
    ExposerHandle(ExposerHandle&&) = delete;
    auto operator=(ExposerHandle&&) -> ExposerHandle& = delete;
    virtual ~ExposerHandle() = default;
    virtual void RegisterCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
    virtual void RemoveCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
  };

  explicit MetricsRegistry(
      int port, std::unique_ptr<ExposerHandle> exposer_handle = nullptr);
  ~MetricsRegistry() noexcept;
  MetricsRegistry(const MetricsRegistry&) = delete;
  auto operator=(const MetricsRegistry&) -> MetricsRegistry& = delete;
  MetricsRegistry(MetricsRegistry&&) = delete;
  auto operator=(MetricsRegistry&&) -> MetricsRegistry& = delete;

  std::shared_ptr<prometheus::Registry>
      registry;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Counter>* requests_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Counter>* outcomes_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* batches_dispatched{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Histogram* batch_size{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Histogram* queue_wait_ms{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Gauge>* model_queue_depth_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Gauge* runners_registered{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)

 private:
  void initialize(int port, std::unique_ptr<ExposerHandle> exposer_handle);

  std::unique_ptr<ExposerHandle> exposer_;
};

auto init_metrics(
    int port,
    std::unique_ptr<MetricsRegistry::ExposerHandle> exposer_handle = nullptr)
    -> bool;
void shutdown_metrics();
auto get_metrics() -> std::shared_ptr<MetricsRegistry>;

// No-ops while metrics are not initialized.
void record_request(std::string_view path);
void record_outcome(std::string_view kind);
void record_batch_dispatched(std::size_t size);
void observe_queue_wait_ms(double wait_ms);
void set_model_queue_depth(std::string_view model_id, std::size_t depth);
void set_runners_registered(std::size_t count);

}  // namespace inference_gateway
