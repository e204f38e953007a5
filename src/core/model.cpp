#include "model.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <limits>
#include <memory>
#include <mutex>
#include <ranges>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "monitoring/metrics.hpp"
#include "utils/archive_utils.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace model_batcher {

namespace {

auto
resolve_queue_size(const ModelArchive& archive, int queue_size) -> std::size_t
{
  if (archive.model_config.has_value() &&
      archive.model_config->job_queue_size > 0) {
    queue_size = archive.model_config->job_queue_size;
  }
  if (queue_size <= 0) {
    throw std::invalid_argument(std::format(
        "Job queue size for model {} must be > 0, got {}", archive.model_name,
        queue_size));
  }
  return static_cast<std::size_t>(queue_size);
}

auto
uses_job_tickets(const ModelArchive& archive) -> bool
{
  return archive.model_config.has_value() &&
         archive.model_config->use_job_ticket;
}

}  // namespace

Model::Model(ModelArchive archive, int queue_size, RuntimeConfig runtime)
    : archive_(std::move(archive)),
      model_version_name_{archive_.model_name, archive_.model_version},
      runtime_(std::move(runtime)),
      devices_(resolve_device_assignment(
          archive_.model_config, runtime_.number_of_gpu)),
      tickets_(uses_job_tickets(archive_)),
      job_queues_(
          resolve_queue_size(archive_, queue_size),
          model_version_name_.to_string())
{
  const auto& defaults = runtime_.defaults;
  min_workers_ = defaults.workers_per_model;
  max_workers_ = defaults.workers_per_model;
  response_timeout_ = defaults.response_timeout_sec;
  parallel_level_ = devices_.parallel_level;

  if (const auto& config = archive_.model_config; config.has_value()) {
    min_workers_ = config->min_workers.value_or(defaults.workers_per_model);
    max_workers_ = config->max_workers.value_or(defaults.workers_per_model);
    batch_size_ = config->batch_size.value_or(defaults.batch_size);
    max_batch_delay_ =
        config->max_batch_delay.value_or(defaults.max_batch_delay_ms);
    response_timeout_ =
        config->response_timeout.value_or(defaults.response_timeout_sec);
    max_retry_timeout_in_mill_ =
        static_cast<int64_t>(config->max_retry_timeout_in_sec) *
        kMillisecondsPerSecond;
    client_timeout_in_mills_ = config->client_timeout_in_mills;
  } else {
    batch_size_ = kDefaultBatchSize;
    max_batch_delay_ = kDefaultMaxBatchDelayMs;
  }

  log_debug(
      runtime_.verbosity,
      std::format(
          "Model {}: device={} num_cores={} batch_size={} max_batch_delay={}ms "
          "queue_size={} job_tickets={}",
          model_version_name_.to_string(), to_string(devices_.device_type),
          devices_.num_cores, batch_size_.load(), max_batch_delay_.load(),
          job_queues_.data_queue()->capacity(), tickets_.enabled()));
}

// =============================================================================
// Snapshot export / import
// =============================================================================

auto
Model::get_model_state(bool is_default_version) const -> ModelState
{
  ModelState state;
  state.default_version = is_default_version;
  state.mar_name = archive_utils::get_filename_from_url(get_model_url());
  state.min_workers = get_min_workers();
  state.max_workers = get_max_workers();
  state.batch_size = get_batch_size();
  state.max_batch_delay = get_max_batch_delay();
  state.response_timeout = get_response_timeout();
  if (const int level = parallel_level_; level > 1) {
    state.parallel_level = level;
  }
  return state;
}

void
Model::set_model_state(const ModelState& state)
{
  min_workers_ = state.min_workers;
  max_workers_ = state.max_workers;
  max_batch_delay_ = state.max_batch_delay;
  response_timeout_ = state.response_timeout;
  batch_size_ = state.batch_size;
  if (state.parallel_level.has_value()) {
    parallel_level_ = *state.parallel_level;
  }
}

auto
Model::get_response_timeout() const -> int
{
  return runtime_.debug ? std::numeric_limits<int>::max()
                        : response_timeout_.load();
}

// =============================================================================
// Job queues and admission
// =============================================================================

void
Model::add_job(std::string_view thread_id, std::shared_ptr<Job> job)
{
  job_queues_.get_or_create(thread_id)->push_back(std::move(job));
}

void
Model::remove_job_queue(std::string_view thread_id)
{
  job_queues_.remove(thread_id);
}

auto
Model::add_job(std::shared_ptr<Job> job) -> bool
{
  if (tickets_.enabled() && !tickets_.try_acquire()) {
    log_info(runtime_.verbosity, "There are no job tickets");
    increment_rejected_jobs(model_version_name_.to_string(), "no_ticket");
    return false;
  }
  if (!job_queues_.data_queue()->offer(std::move(job))) {
    if (tickets_.enabled()) {
      tickets_.increment();
    }
    log_debug(
        runtime_.verbosity,
        std::format(
            "Data queue of {} is full", model_version_name_.to_string()));
    increment_rejected_jobs(model_version_name_.to_string(), "queue_full");
    return false;
  }
  return true;
}

void
Model::add_first(std::shared_ptr<Job> job)
{
  job_queues_.data_queue()->push_front(std::move(job));
}

auto
Model::get_data_queue_size() const -> std::size_t
{
  return job_queues_.data_queue()->size();
}

// =============================================================================
// Batch assembly
// =============================================================================

void
Model::poll_batch(
    std::string_view thread_id, std::chrono::milliseconds wait_time,
    JobBatch& batch, const std::stop_token& stop)
{
  if (thread_id.empty()) {
    throw std::invalid_argument("poll_batch requires a worker thread id");
  }
  if (!batch.empty()) {
    throw std::invalid_argument(
        "The job batch provided contains stale jobs. Clear them!!");
  }

  if (auto own_queue = job_queues_.get(thread_id);
      own_queue != nullptr && !own_queue->empty()) {
    std::shared_ptr<Job> job;
    if (own_queue->wait_for_and_pop(job, wait_time, stop)) {
      batch.push_back(std::move(job));
      finish_batch(batch);
      return;
    }
    if (stop.stop_requested()) {
      cancel_poll("control queue poll");
    }
  }

  if (tickets_.enabled()) {
    tickets_.increment();
  }

  const InterruptibleLockGuard guard(batch_lock_, stop);
  if (!guard.owns_lock()) {
    revoke_unconsumed_ticket();
    cancel_poll("batch lock wait");
  }

  const auto& data_queue = job_queues_.data_queue();
  std::shared_ptr<Job> first;
  if (!data_queue->wait_and_pop(first, stop)) {
    revoke_unconsumed_ticket();
    cancel_poll("first job wait");
  }
  log_trace(
      runtime_.verbosity, std::format("get first job: {}", first->get_job_id()));

  const bool unbatchable = is_unbatchable(first->get_cmd());
  batch.push_back(std::move(first));
  if (!unbatchable) {
    fill_batch(*data_queue, batch, stop);
  }
  finish_batch(batch);
}

void
Model::fill_batch(
    JobQueue& data_queue, JobBatch& batch, const std::stop_token& stop)
{
  Clock::duration remaining = std::chrono::milliseconds(max_batch_delay_);
  auto begin = Clock::now();
  const int batch_size = batch_size_;

  for (int i = 0; i < batch_size - 1; ++i) {
    std::shared_ptr<Job> job;
    if (!data_queue.wait_for_and_pop(job, remaining, stop)) {
      if (stop.stop_requested()) {
        return_to_data_queue(batch);
        cancel_poll("batch fill");
      }
      break;
    }
    const auto end = Clock::now();
    if (is_unbatchable(job->get_cmd())) {
      data_queue.push_front(std::move(job));
      break;
    }
    remaining -= end - begin;
    begin = end;
    if (!job->is_expired(Clock::now())) {
      batch.push_back(std::move(job));
    } else {
      log_warning(std::format(
          "Drop inference request {} due to client timeout",
          job->get_payload().get_request_id()));
      increment_expired_jobs(model_version_name_.to_string());
    }
    if (remaining <= Clock::duration::zero()) {
      break;
    }
  }
}

void
Model::return_to_data_queue(JobBatch& batch)
{
  for (auto& job : std::views::reverse(batch)) {
    job_queues_.data_queue()->push_front(std::move(job));
  }
  batch.clear();
}

void
Model::revoke_unconsumed_ticket()
{
  if (tickets_.enabled() && tickets_.try_acquire()) {
    log_debug(
        runtime_.verbosity,
        std::format(
            "Revoked job ticket of cancelled poll on {}",
            model_version_name_.to_string()));
  }
}

void
Model::cancel_poll(std::string_view phase)
{
  throw PollCancelledException(std::format(
      "poll_batch on {} cancelled during {}", model_version_name_.to_string(),
      phase));
}

void
Model::finish_batch(const JobBatch& batch) const
{
  log_trace(
      runtime_.verbosity, std::format("sending jobs, size: {}", batch.size()));
  observe_batch_size(model_version_name_.to_string(), batch.size());
}

// =============================================================================
// Devices
// =============================================================================

auto
Model::get_device_ids() const -> std::vector<int>
{
  const std::scoped_lock lock(device_ids_mutex_);
  return devices_.device_ids;
}

void
Model::set_device_ids(std::span<const int> device_ids)
{
  const std::scoped_lock lock(device_ids_mutex_);
  if (device_ids.size() > devices_.device_ids.size()) {
    throw std::invalid_argument(std::format(
        "Cannot copy {} device id(s) into a list of {}", device_ids.size(),
        devices_.device_ids.size()));
  }
  std::ranges::copy(device_ids, devices_.device_ids.begin());
}

auto
Model::next_worker_gpu_id() -> int
{
  const int num_cores = devices_.num_cores;
  if (num_cores <= 0) {
    return -1;
  }
  const auto slot = static_cast<unsigned int>(gpu_counter_.fetch_add(1));
  const auto index =
      static_cast<std::size_t>(slot % static_cast<unsigned int>(num_cores));
  if (devices_.has_cfg_device_ids) {
    const std::scoped_lock lock(device_ids_mutex_);
    return devices_.device_ids[index];
  }
  return static_cast<int>(index);
}

}  // namespace model_batcher
