#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <utility>

#include "worker_command.hpp"

namespace model_batcher {

using Clock = std::chrono::steady_clock;

// =============================================================================
// RequestInput: the client-facing part of a job
// =============================================================================

class RequestInput {
 public:
  explicit RequestInput(std::string request_id)
      : request_id_(std::move(request_id))
  {
  }

  [[nodiscard]] auto get_request_id() const -> const std::string&
  {
    return request_id_;
  }

  void update_headers(const std::string& key, const std::string& value)
  {
    headers_[key] = value;
  }

  [[nodiscard]] auto get_headers() const
      -> const std::map<std::string, std::string, std::less<>>&
  {
    return headers_;
  }

  // A non-positive timeout means the client never gives up on the request.
  void set_client_expire_ts(std::chrono::milliseconds timeout);

  void set_client_expire_ts(Clock::time_point deadline)
  {
    client_expire_ts_ = deadline;
  }

  [[nodiscard]] auto get_client_expire_ts() const -> Clock::time_point
  {
    return client_expire_ts_;
  }

 private:
  std::string request_id_;
  std::map<std::string, std::string, std::less<>> headers_;
  Clock::time_point client_expire_ts_ = Clock::time_point::max();
};

// =============================================================================
// Job: a request routed to one model version, carried through the queues
// as std::shared_ptr<Job>.
// =============================================================================

class Job {
 public:
  Job(std::string model_name, std::string model_version, WorkerCommand cmd,
      RequestInput payload);

  [[nodiscard]] auto get_job_id() const -> const std::string&
  {
    return payload_.get_request_id();
  }
  [[nodiscard]] auto get_model_name() const -> const std::string&
  {
    return model_name_;
  }
  [[nodiscard]] auto get_model_version() const -> const std::string&
  {
    return model_version_;
  }
  [[nodiscard]] auto get_cmd() const -> WorkerCommand { return cmd_; }
  [[nodiscard]] auto get_payload() const -> const RequestInput&
  {
    return payload_;
  }
  [[nodiscard]] auto get_begin() const -> Clock::time_point { return begin_; }
  [[nodiscard]] auto get_scheduled() const -> Clock::time_point
  {
    return scheduled_;
  }

  void set_scheduled() { scheduled_ = Clock::now(); }

  [[nodiscard]] auto is_expired(Clock::time_point now) const -> bool
  {
    return payload_.get_client_expire_ts() <= now;
  }

 private:
  std::string model_name_;
  std::string model_version_;
  WorkerCommand cmd_;
  RequestInput payload_;
  Clock::time_point begin_;
  Clock::time_point scheduled_{};
};

}  // namespace model_batcher
