#include "job_queue_table.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace model_batcher {

JobQueueTable::JobQueueTable(
    std::size_t data_queue_capacity, std::string metrics_label)
    : data_queue_(std::make_shared<JobQueue>(
          data_queue_capacity, std::move(metrics_label)))
{
  queues_.emplace(std::string(kDataQueueId), data_queue_);
}

auto
JobQueueTable::get(std::string_view worker_id) const
    -> std::shared_ptr<JobQueue>
{
  const std::shared_lock lock(mutex_);
  if (auto iter = queues_.find(worker_id); iter != queues_.end()) {
    return iter->second;
  }
  return nullptr;
}

auto
JobQueueTable::get_or_create(std::string_view worker_id)
    -> std::shared_ptr<JobQueue>
{
  if (auto existing = get(worker_id)) {
    return existing;
  }
  const std::unique_lock lock(mutex_);
  auto [iter, inserted] =
      queues_.try_emplace(std::string(worker_id), nullptr);
  if (inserted) {
    iter->second = std::make_shared<JobQueue>();
  }
  return iter->second;
}

auto
JobQueueTable::remove(std::string_view worker_id) -> bool
{
  if (worker_id == kDataQueueId) {
    return false;
  }
  const std::unique_lock lock(mutex_);
  if (auto iter = queues_.find(worker_id); iter != queues_.end()) {
    queues_.erase(iter);
    return true;
  }
  return false;
}

auto
JobQueueTable::size() const -> std::size_t
{
  const std::shared_lock lock(mutex_);
  return queues_.size();
}

}  // namespace model_batcher
