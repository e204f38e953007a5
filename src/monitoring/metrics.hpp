#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace prometheus {
class Collectable;
template <typename T>
class Family;
}  // namespace prometheus

namespace model_batcher {

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

  // Binds an HTTP exposer on 0.0.0.0:port.
  explicit MetricsRegistry(int port);
  // Uses the given exposer instead; a null handle keeps the registry
  // in-process only.
  explicit MetricsRegistry(std::unique_ptr<ExposerHandle> exposer_handle);
  ~MetricsRegistry() noexcept;
  MetricsRegistry(const MetricsRegistry&) = delete;
  auto operator=(const MetricsRegistry&) -> MetricsRegistry& = delete;
  MetricsRegistry(MetricsRegistry&&) = delete;
  auto operator=(MetricsRegistry&&) -> MetricsRegistry& = delete;

  std::shared_ptr<prometheus::Registry>
      registry;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Gauge>* job_queue_size_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Counter>* jobs_rejected_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Counter>* jobs_expired_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Histogram>* batch_size_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)

 private:
  void initialize(std::unique_ptr<ExposerHandle> exposer_handle);

  std::unique_ptr<ExposerHandle> exposer_;
};

auto init_metrics(int port) -> bool;
auto init_metrics(std::unique_ptr<MetricsRegistry::ExposerHandle> exposer)
    -> bool;
void shutdown_metrics();
auto get_metrics() -> std::shared_ptr<MetricsRegistry>;

// All helpers below are no-ops while metrics are not initialised.
void set_job_queue_size(std::string_view queue, std::size_t size);
void increment_rejected_jobs(std::string_view model, std::string_view reason);
void increment_expired_jobs(std::string_view model);
void observe_batch_size(std::string_view model, std::size_t size);

}  // namespace model_batcher
