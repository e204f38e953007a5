#include "job.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace model_batcher {

void
RequestInput::set_client_expire_ts(std::chrono::milliseconds timeout)
{
  if (timeout.count() > 0) {
    client_expire_ts_ = Clock::now() + timeout;
  }
}

Job::Job(
    std::string model_name, std::string model_version, WorkerCommand cmd,
    RequestInput payload)
    : model_name_(std::move(model_name)),
      model_version_(std::move(model_version)), cmd_(cmd),
      payload_(std::move(payload)), begin_(Clock::now())
{
}

}  // namespace model_batcher
