#include "monitoring/metrics.hpp"

#include <prometheus/exposer.h>
#include <prometheus/histogram.h>

#include <atomic>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "utils/logger.hpp"

namespace model_batcher {

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

auto
make_prometheus_exposer(int port)
    -> std::unique_ptr<MetricsRegistry::ExposerHandle>
{
  auto exposer =
      std::make_unique<prometheus::Exposer>(std::format("0.0.0.0:{}", port));
  return std::make_unique<PrometheusExposerHandle>(std::move(exposer));
}

}  // namespace

MetricsRegistry::MetricsRegistry(int port)
    : registry(std::make_shared<prometheus::Registry>())
{
  std::unique_ptr<ExposerHandle> exposer_handle;
  try {
    exposer_handle = make_prometheus_exposer(port);
  }
  catch (const std::exception& e) {
    log_error(std::string("Failed to initialize metrics exposer: ") + e.what());
    throw;
  }
  initialize(std::move(exposer_handle));
}

MetricsRegistry::MetricsRegistry(std::unique_ptr<ExposerHandle> exposer_handle)
    : registry(std::make_shared<prometheus::Registry>())
{
  initialize(std::move(exposer_handle));
}

void
MetricsRegistry::initialize(std::unique_ptr<ExposerHandle> exposer_handle)
{
  if (exposer_handle) {
    exposer_handle->RegisterCollectable(registry);
    exposer_ = std::move(exposer_handle);
  }

  job_queue_size_family = &prometheus::BuildGauge()
                               .Name("job_queue_size")
                               .Help("Number of jobs waiting in a job queue")
                               .Register(*registry);
  jobs_rejected_family =
      &prometheus::BuildCounter()
           .Name("jobs_rejected_total")
           .Help("Jobs refused at admission, by model and reason")
           .Register(*registry);
  jobs_expired_family =
      &prometheus::BuildCounter()
           .Name("jobs_expired_total")
           .Help("Jobs dropped while batching because the client gave up")
           .Register(*registry);
  batch_size_family = &prometheus::BuildHistogram()
                           .Name("batch_size")
                           .Help("Number of jobs handed to a worker per poll")
                           .Register(*registry);
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

auto
install_metrics(std::shared_ptr<MetricsRegistry> new_metrics) -> bool
{
  std::shared_ptr<MetricsRegistry> expected{nullptr};
  if (!metrics_atomic().compare_exchange_strong(
          expected, std::move(new_metrics), std::memory_order_acq_rel,
          std::memory_order_acquire)) {
    log_warning("Metrics were previously initialized");
    return false;
  }
  return true;
}
}  // namespace

auto
init_metrics(int port) -> bool
{
  try {
    return install_metrics(std::make_shared<MetricsRegistry>(port));
  }
  catch (const std::exception& e) {
    log_error(std::string("Metrics initialization failed: ") + e.what());
    return false;
  }
}

auto
init_metrics(std::unique_ptr<MetricsRegistry::ExposerHandle> exposer) -> bool
{
  try {
    return install_metrics(
        std::make_shared<MetricsRegistry>(std::move(exposer)));
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
set_job_queue_size(std::string_view queue, std::size_t size)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->job_queue_size_family != nullptr) {
    metrics_ptr->job_queue_size_family->Add({{"queue", std::string(queue)}})
        .Set(static_cast<double>(size));
  }
}

void
increment_rejected_jobs(std::string_view model, std::string_view reason)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->jobs_rejected_family != nullptr) {
    metrics_ptr->jobs_rejected_family
        ->Add({{"model", std::string(model)}, {"reason", std::string(reason)}})
        .Increment();
  }
}

void
increment_expired_jobs(std::string_view model)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->jobs_expired_family != nullptr) {
    metrics_ptr->jobs_expired_family->Add({{"model", std::string(model)}})
        .Increment();
  }
}

void
observe_batch_size(std::string_view model, std::size_t size)
{
  auto metrics_ptr = get_metrics();
  if (metrics_ptr && metrics_ptr->batch_size_family != nullptr) {
    metrics_ptr->batch_size_family
        ->Add({{"model", std::string(model)}}, kBatchSizeBuckets)
        .Observe(static_cast<double>(size));
  }
}

}  // namespace model_batcher
