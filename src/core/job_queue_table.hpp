#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "job_queue.hpp"
#include "utils/transparent_hash.hpp"

namespace model_batcher {

// =============================================================================
// JobQueueTable
// -----------------------------------------------------------------------------
// Worker-context id -> JobQueue. The shared data queue lives under
// kDataQueueId for the lifetime of the table; every other entry is a
// private, unbounded control queue created on first use.
// =============================================================================
class JobQueueTable {
 public:
  static constexpr std::string_view kDataQueueId = "DATA_QUEUE";

  JobQueueTable(std::size_t data_queue_capacity, std::string metrics_label);

  [[nodiscard]] auto data_queue() const -> const std::shared_ptr<JobQueue>&
  {
    return data_queue_;
  }

  // Null when no queue exists for the id.
  [[nodiscard]] auto get(std::string_view worker_id) const
      -> std::shared_ptr<JobQueue>;

  // Insert-if-absent: concurrent callers for the same id all get the queue
  // of whichever call inserted first.
  [[nodiscard]] auto get_or_create(std::string_view worker_id)
      -> std::shared_ptr<JobQueue>;

  // Never removes the data queue. Returns whether an entry was erased.
  auto remove(std::string_view worker_id) -> bool;

  [[nodiscard]] auto size() const -> std::size_t;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<
      std::string, std::shared_ptr<JobQueue>, TransparentHash, std::equal_to<>>
      queues_;
  std::shared_ptr<JobQueue> data_queue_;
};

}  // namespace model_batcher
