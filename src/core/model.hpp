#pragma once

#include <atomic>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "device_assignment.hpp"
#include "interruptible_mutex.hpp"
#include "job.hpp"
#include "job_queue_table.hpp"
#include "job_ticket_throttle.hpp"
#include "model_archive.hpp"
#include "utils/runtime_config.hpp"

namespace model_batcher {

// =============================================================================
// ModelVersionName: external key of a loaded model version
// =============================================================================
struct ModelVersionName {
  std::string name;
  std::string version;

  auto operator<=>(const ModelVersionName&) const = default;

  [[nodiscard]] auto to_string() const -> std::string
  {
    return version.empty() ? name : name + "/" + version;
  }
};

struct ModelVersionNameHash {
  auto operator()(const ModelVersionName& key) const noexcept -> std::size_t
  {
    const std::size_t name_hash = std::hash<std::string>{}(key.name);
    const std::size_t version_hash = std::hash<std::string>{}(key.version);
    return name_hash ^ (version_hash + 0x9e3779b9 + (name_hash << 6) +
                        (name_hash >> 2));
  }
};

// =============================================================================
// ModelState: flat record served by model-status queries and replayed on
// restore. parallel_level is only exported when greater than 1.
// =============================================================================
struct ModelState {
  bool default_version = false;
  std::string mar_name;
  int min_workers = 0;
  int max_workers = 0;
  int batch_size = 0;
  int max_batch_delay = 0;
  int response_timeout = 0;
  std::optional<int> parallel_level;
};

using JobBatch = std::vector<std::shared_ptr<Job>>;

// =============================================================================
// Model
// -----------------------------------------------------------------------------
// Request-admission and batching core of one model version:
//   - per-worker job queues plus the shared, bounded data queue
//   - batch assembly for worker threads (poll_batch)
//   - job-ticket admission throttle
//   - device assignment and round-robin GPU counter
// Scalar settings can be changed while workers poll; they are read once per
// poll.
// =============================================================================
class Model {
 public:
  static constexpr std::string_view kDefaultDataQueue =
      JobQueueTable::kDataQueueId;

  // queue_size bounds the data queue unless the archive config sets a
  // positive jobQueueSize. Throws std::invalid_argument when the resolved
  // size is not positive.
  Model(ModelArchive archive, int queue_size, RuntimeConfig runtime);

  Model(const Model&) = delete;
  auto operator=(const Model&) -> Model& = delete;
  Model(Model&&) = delete;
  auto operator=(Model&&) -> Model& = delete;
  ~Model() = default;

  // --- snapshot -------------------------------------------------------------
  [[nodiscard]] auto get_model_state(bool is_default_version) const
      -> ModelState;
  void set_model_state(const ModelState& state);

  // --- identity -------------------------------------------------------------
  [[nodiscard]] auto get_model_name() const -> const std::string&
  {
    return archive_.model_name;
  }
  [[nodiscard]] auto get_version() const -> const std::string&
  {
    return archive_.model_version;
  }
  [[nodiscard]] auto get_model_version_name() const -> const ModelVersionName&
  {
    return model_version_name_;
  }
  [[nodiscard]] auto get_model_url() const -> const std::string&
  {
    return archive_.url;
  }
  [[nodiscard]] auto get_model_dir() const -> const std::filesystem::path&
  {
    return archive_.model_dir;
  }
  [[nodiscard]] auto get_model_archive() const -> const ModelArchive&
  {
    return archive_;
  }

  // --- worker and batching settings -----------------------------------------
  [[nodiscard]] auto get_min_workers() const -> int { return min_workers_; }
  void set_min_workers(int min_workers) { min_workers_ = min_workers; }
  [[nodiscard]] auto get_max_workers() const -> int { return max_workers_; }
  void set_max_workers(int max_workers) { max_workers_ = max_workers; }
  [[nodiscard]] auto get_batch_size() const -> int { return batch_size_; }
  void set_batch_size(int batch_size) { batch_size_ = batch_size; }
  [[nodiscard]] auto get_max_batch_delay() const -> int
  {
    return max_batch_delay_;
  }
  void set_max_batch_delay(int max_batch_delay)
  {
    max_batch_delay_ = max_batch_delay;
  }

  // INT_MAX while the runtime runs in debug mode.
  [[nodiscard]] auto get_response_timeout() const -> int;
  void set_response_timeout(int response_timeout)
  {
    response_timeout_ = response_timeout;
  }

  [[nodiscard]] auto get_max_retry_timeout_in_mill() const -> int64_t
  {
    return max_retry_timeout_in_mill_;
  }
  void set_max_retry_timeout_in_mill(int64_t timeout)
  {
    max_retry_timeout_in_mill_ = timeout;
  }
  [[nodiscard]] auto get_client_timeout_in_mills() const -> int64_t
  {
    return client_timeout_in_mills_;
  }
  void set_client_timeout_in_mills(int64_t timeout)
  {
    client_timeout_in_mills_ = timeout;
  }

  [[nodiscard]] auto is_workflow_model() const -> bool
  {
    return workflow_model_;
  }
  void set_workflow_model(bool workflow_model)
  {
    workflow_model_ = workflow_model;
  }

  // --- job queues -----------------------------------------------------------
  // Private control queue of a worker; created on first use, unbounded.
  void add_job(std::string_view thread_id, std::shared_ptr<Job> job);
  // No-op for the data queue.
  void remove_job_queue(std::string_view thread_id);
  // Data queue admission. False when no ticket is available or the data
  // queue is full; the caller decides how to answer the request.
  [[nodiscard]] auto add_job(std::shared_ptr<Job> job) -> bool;
  // Head insert into the data queue.
  void add_first(std::shared_ptr<Job> job);
  [[nodiscard]] auto get_data_queue_size() const -> std::size_t;

  // Fills an empty batch with 1..batch_size jobs.
  //
  // A job waiting in the worker's private queue is returned alone. Otherwise
  // the caller takes the batch lock, waits indefinitely for the first data
  // job and keeps polling the data queue until the batch is full, the
  // max_batch_delay budget is spent or a describe/stream-predict job shows
  // up (that one goes back to the head of the queue). Jobs whose client
  // deadline passed are dropped, except the first one.
  //
  // Throws std::invalid_argument for an empty thread_id or a non-empty
  // batch, and PollCancelledException when stop is requested while
  // blocked; jobs already pulled by a cancelled call go back to the head of
  // the data queue.
  void poll_batch(
      std::string_view thread_id, std::chrono::milliseconds wait_time,
      JobBatch& batch, const std::stop_token& stop = {});

  // --- failure counter ------------------------------------------------------
  auto incr_failed_inf_reqs() -> int
  {
    return failed_inf_reqs_.fetch_add(1) + 1;
  }
  void reset_failed_inf_reqs() { failed_inf_reqs_.store(0); }
  [[nodiscard]] auto get_failed_inf_reqs() const -> int
  {
    return failed_inf_reqs_.load();
  }

  // --- devices --------------------------------------------------------------
  [[nodiscard]] auto get_device_ids() const -> std::vector<int>;
  // Copies ids over the front of the current list; a longer list throws
  // std::invalid_argument.
  void set_device_ids(std::span<const int> device_ids);
  [[nodiscard]] auto get_parallel_level() const -> int
  {
    return parallel_level_;
  }
  [[nodiscard]] auto get_parallel_type() const -> ParallelType
  {
    return devices_.parallel_type;
  }
  [[nodiscard]] auto get_device_type() const -> DeviceType
  {
    return devices_.device_type;
  }
  [[nodiscard]] auto get_num_cores() const -> int { return devices_.num_cores; }
  [[nodiscard]] auto is_has_cfg_device_ids() const -> bool
  {
    return devices_.has_cfg_device_ids;
  }
  [[nodiscard]] auto get_gpu_counter() -> std::atomic<int>&
  {
    return gpu_counter_;
  }
  // GPU for the next worker to start, -1 for CPU-only models.
  [[nodiscard]] auto next_worker_gpu_id() -> int;

  // --- job tickets ----------------------------------------------------------
  [[nodiscard]] auto is_use_job_ticket() const -> bool
  {
    return tickets_.enabled();
  }
  auto inc_num_job_tickets() -> int { return tickets_.increment(); }
  auto dec_num_job_tickets() -> int { return tickets_.decrement(); }
  [[nodiscard]] auto get_job_tickets() -> bool { return tickets_.try_acquire(); }
  [[nodiscard]] auto get_num_job_tickets() const -> int
  {
    return tickets_.available();
  }

 private:
  void fill_batch(
      JobQueue& data_queue, JobBatch& batch, const std::stop_token& stop);
  void return_to_data_queue(JobBatch& batch);
  void revoke_unconsumed_ticket();
  [[noreturn]] void cancel_poll(std::string_view phase);
  void finish_batch(const JobBatch& batch) const;

  ModelArchive archive_;
  ModelVersionName model_version_name_;
  RuntimeConfig runtime_;

  std::atomic<int> min_workers_{0};
  std::atomic<int> max_workers_{0};
  std::atomic<int> batch_size_{0};
  std::atomic<int> max_batch_delay_{0};
  std::atomic<int> response_timeout_{0};
  std::atomic<int> parallel_level_{1};
  std::atomic<int64_t> max_retry_timeout_in_mill_{
      static_cast<int64_t>(kDefaultMaxRetryTimeoutSec) *
      kMillisecondsPerSecond};
  std::atomic<int64_t> client_timeout_in_mills_{0};
  std::atomic<bool> workflow_model_{false};

  DeviceAssignment devices_;
  mutable std::mutex device_ids_mutex_;
  std::atomic<int> gpu_counter_{0};
  std::atomic<int> failed_inf_reqs_{0};

  JobTicketThrottle tickets_;
  JobQueueTable job_queues_;
  InterruptibleMutex batch_lock_;
};

}  // namespace model_batcher
