#include "batching_simulation.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "core/exception_logging_utils.hpp"
#include "core/job.hpp"
#include "core/model.hpp"
#include "core/model_archive.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace model_batcher {

namespace {

constexpr std::string_view kSimulatedModelName = "sim_model";
constexpr std::string_view kSimulatedModelVersion = "1.0";
constexpr auto kControlPollWait = std::chrono::milliseconds(10);
constexpr auto kDrainPollInterval = std::chrono::milliseconds(1);
constexpr auto kDrainGrace = std::chrono::milliseconds(50);

struct WorkerCounters {
  std::atomic<std::size_t> batches{0};
  std::atomic<std::size_t> batched_jobs{0};
  std::atomic<std::size_t> control_jobs{0};
  std::atomic<std::size_t> describe_jobs{0};
  std::atomic<int> running{0};
};

auto
make_archive(const SimulationOptions& opts) -> ModelArchive
{
  ModelArchive archive;
  archive.model_name = std::string(kSimulatedModelName);
  archive.model_version = std::string(kSimulatedModelVersion);
  archive.url = std::format("{}.mar", kSimulatedModelName);

  if (!opts.model_config_path.empty()) {
    auto config = load_model_config(opts.model_config_path);
    if (!config.valid) {
      throw ConfigLoadingException(std::format(
          "Invalid model configuration: {}", opts.model_config_path));
    }
    if (opts.queue_size.has_value()) {
      config.job_queue_size = *opts.queue_size;
    }
    archive.model_dir =
        std::filesystem::path(opts.model_config_path).parent_path();
    archive.model_config = std::move(config);
  }
  return archive;
}

void
record_batch(const JobBatch& batch, WorkerCounters& counters)
{
  if (batch.size() == 1 && batch.front()->get_cmd() == WorkerCommand::Load) {
    counters.control_jobs.fetch_add(1);
    return;
  }
  for (const auto& job : batch) {
    if (job->get_cmd() == WorkerCommand::Describe) {
      counters.describe_jobs.fetch_add(1);
    }
  }
  counters.batches.fetch_add(1);
  counters.batched_jobs.fetch_add(batch.size());
}

void
worker_loop(
    Model& model, const std::string& thread_id, const std::stop_token& stop,
    WorkerCounters& counters)
{
  while (!stop.stop_requested()) {
    JobBatch batch;
    model.poll_batch(thread_id, kControlPollWait, batch, stop);
    for (const auto& job : batch) {
      job->set_scheduled();
    }
    record_batch(batch, counters);
  }
}

void
submit_requests(
    Model& model, const SimulationOptions& opts, SimulationStats& stats)
{
  const auto client_timeout = std::chrono::milliseconds(
      opts.client_timeout_ms.value_or(model.get_client_timeout_in_mills()));

  for (int i = 0; i < opts.requests; ++i) {
    const bool describe =
        opts.describe_every > 0 && (i + 1) % opts.describe_every == 0;
    RequestInput input(std::format("req-{}", i));
    input.set_client_expire_ts(client_timeout);
    auto job = std::make_shared<Job>(
        model.get_model_name(), model.get_version(),
        describe ? WorkerCommand::Describe : WorkerCommand::Predict,
        std::move(input));

    ++stats.submitted;
    if (model.add_job(std::move(job))) {
      ++stats.accepted;
    } else {
      ++stats.rejected;
    }
    if (opts.producer_delay_us > 0) {
      std::this_thread::sleep_for(
          std::chrono::microseconds(opts.producer_delay_us));
    }
  }
}

}  // namespace

auto
run_batching_simulation(
    const SimulationOptions& opts, const RuntimeConfig& runtime)
    -> SimulationStats
{
  Model model(
      make_archive(opts), opts.queue_size.value_or(runtime.job_queue_size),
      runtime);
  if (opts.batch_size.has_value()) {
    model.set_batch_size(*opts.batch_size);
  }
  if (opts.max_batch_delay_ms.has_value()) {
    model.set_max_batch_delay(*opts.max_batch_delay_ms);
  }

  log_info(
      runtime.verbosity,
      std::format(
          "Simulating {} with {} worker(s), batch size {}, max batch delay "
          "{} ms",
          model.get_model_version_name().to_string(), opts.workers,
          model.get_batch_size(), model.get_max_batch_delay()));

  WorkerCounters counters;
  std::vector<std::string> thread_ids;
  thread_ids.reserve(static_cast<std::size_t>(opts.workers));
  for (int i = 0; i < opts.workers; ++i) {
    thread_ids.push_back(std::format("W-{}", i));
    const int gpu_id = model.next_worker_gpu_id();
    log_debug(
        runtime.verbosity,
        gpu_id < 0
            ? std::format("{} runs on CPU", thread_ids.back())
            : std::format("{} runs on GPU {}", thread_ids.back(), gpu_id));
    model.add_job(
        thread_ids.back(),
        std::make_shared<Job>(
            model.get_model_name(), model.get_version(), WorkerCommand::Load,
            RequestInput(std::format("load-{}", thread_ids.back()))));
  }

  SimulationStats stats;
  {
    std::vector<std::jthread> workers;
    workers.reserve(thread_ids.size());
    for (const auto& thread_id : thread_ids) {
      counters.running.fetch_add(1);
      workers.emplace_back([&model, &counters,
                            &thread_id](const std::stop_token& stop) {
        const std::string prefix = std::format("Worker {}: ", thread_id);
        if (!run_with_logged_exceptions(
                [&] { worker_loop(model, thread_id, stop, counters); },
                ExceptionLoggingMessages{prefix})) {
          model.incr_failed_inf_reqs();
        }
        counters.running.fetch_sub(1);
      });
    }

    submit_requests(model, opts, stats);

    while (model.get_data_queue_size() > 0 && counters.running.load() > 0) {
      std::this_thread::sleep_for(kDrainPollInterval);
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(model.get_max_batch_delay()) + kDrainGrace);
    for (auto& worker : workers) {
      worker.request_stop();
    }
  }

  for (const auto& thread_id : thread_ids) {
    model.remove_job_queue(thread_id);
  }

  if (const int failed = model.get_failed_inf_reqs(); failed > 0) {
    log_warning(std::format("{} worker(s) stopped on an error", failed));
  }

  stats.batches = counters.batches.load();
  stats.batched_jobs = counters.batched_jobs.load();
  stats.control_jobs = counters.control_jobs.load();
  stats.describe_jobs = counters.describe_jobs.load();
  stats.left_in_queue = model.get_data_queue_size();
  return stats;
}

void
log_simulation_stats(const SimulationStats& stats, VerbosityLevel verbosity)
{
  log_stats(
      verbosity,
      std::format(
          "Requests: {} submitted, {} accepted, {} rejected", stats.submitted,
          stats.accepted, stats.rejected));
  log_stats(
      verbosity,
      std::format(
          "Batches: {} (mean size {:.2f}), {} describe, {} control",
          stats.batches, stats.mean_batch_size(), stats.describe_jobs,
          stats.control_jobs));
  log_stats(
      verbosity,
      std::format(
          "Dropped on client timeout: {}, left in queue: {}", stats.dropped(),
          stats.left_in_queue));
}

}  // namespace model_batcher
