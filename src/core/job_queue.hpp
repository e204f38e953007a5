#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>

#include "monitoring/metrics.hpp"

namespace model_batcher {
class Job;
// =============================================================================
// Thread-safe double-ended job queue
// -----------------------------------------------------------------------------
// Producers append at the tail; consumers take from the head. A job pulled
// speculatively can be put back at the head. Every blocking wait accepts a
// stop token and returns false when a stop is requested; a job is removed
// only when the call returns true.
// =============================================================================

class JobQueue {
 public:
  // capacity == 0 means unbounded. A non-empty metrics label publishes the
  // queue depth to the job_queue_size gauge.
  explicit JobQueue(std::size_t capacity = 0, std::string metrics_label = {})
      : capacity_(capacity), metrics_label_(std::move(metrics_label))
  {
    report_size(0);
  }

  // Non-blocking tail insert that honours the capacity.
  [[nodiscard]] auto offer(std::shared_ptr<Job> job) -> bool
  {
    if (job == nullptr) {
      return false;
    }
    {
      const std::scoped_lock lock(mutex_);
      if (capacity_ > 0 && queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(job));
      report_size(queue_.size());
    }
    cv_.notify_one();
    return true;
  }

  // Unconditional inserts. Reinsertion of an already admitted job must not
  // fail, so these ignore the capacity.
  void push_back(std::shared_ptr<Job> job) { insert(std::move(job), false); }
  void push_front(std::shared_ptr<Job> job) { insert(std::move(job), true); }

  [[nodiscard]] auto try_pop(std::shared_ptr<Job>& job) -> bool
  {
    const std::scoped_lock lock(mutex_);
    return pop_front_locked(job);
  }

  [[nodiscard]] auto wait_and_pop(
      std::shared_ptr<Job>& job, const std::stop_token& stop) -> bool
  {
    std::unique_lock lock(mutex_);
    if (!cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
      return false;
    }
    return pop_front_locked(job);
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto wait_for_and_pop(
      std::shared_ptr<Job>& job,
      const std::chrono::duration<Rep, Period>& timeout,
      const std::stop_token& stop = {}) -> bool
  {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(
            lock, stop, timeout, [this] { return !queue_.empty(); })) {
      return false;
    }
    return pop_front_locked(job);
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return queue_.size();
  }

  [[nodiscard]] auto empty() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return queue_.empty();
  }

  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

 private:
  void insert(std::shared_ptr<Job> job, bool at_front)
  {
    if (job == nullptr) {
      return;
    }
    {
      const std::scoped_lock lock(mutex_);
      if (at_front) {
        queue_.push_front(std::move(job));
      } else {
        queue_.push_back(std::move(job));
      }
      report_size(queue_.size());
    }
    cv_.notify_one();
  }

  auto pop_front_locked(std::shared_ptr<Job>& job) -> bool
  {
    if (queue_.empty()) {
      return false;
    }
    job = std::move(queue_.front());
    queue_.pop_front();
    report_size(queue_.size());
    return true;
  }

  void report_size(std::size_t size) const
  {
    if (!metrics_label_.empty()) {
      set_job_queue_size(metrics_label_, size);
    }
  }

  const std::size_t capacity_;
  const std::string metrics_label_;
  mutable std::mutex mutex_;
  std::deque<std::shared_ptr<Job>> queue_;
  std::condition_variable_any cv_;
};
}  // namespace model_batcher
