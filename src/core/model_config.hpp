#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/device_type.hpp"
#include "utils/runtime_config.hpp"

namespace model_batcher {

// Parallelism strategy run inside a worker. Stored and exposed only.
enum class ParallelType : uint8_t { None, PP, TP, PPTP, Custom };

inline auto
to_string(ParallelType type) -> const char*
{
  using enum ParallelType;
  switch (type) {
    case None:
      return "";
    case PP:
      return "pp";
    case TP:
      return "tp";
    case PPTP:
      return "pptp";
    case Custom:
      return "custom";
    default:
      return "invalid";
  }
}

inline auto
parse_parallel_type(const std::string& value) -> ParallelType
{
  std::string lower(value.size(), '\0');
  std::ranges::transform(value, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  using enum ParallelType;
  if (lower.empty() || lower == "none") {
    return None;
  }
  if (lower == "pp") {
    return PP;
  }
  if (lower == "tp") {
    return TP;
  }
  if (lower == "pptp") {
    return PPTP;
  }
  if (lower == "custom") {
    return Custom;
  }
  throw std::invalid_argument("Unknown parallel type: " + value);
}

// =============================================================================
// ModelConfig
// -----------------------------------------------------------------------------
// Settings embedded in a model archive (model-config.yaml). Worker and
// batching scalars are optional: unset values fall back to the process
// defaults of RuntimeConfig.
// =============================================================================
struct ModelConfig {
  std::optional<int> min_workers;
  std::optional<int> max_workers;
  std::optional<int> batch_size;
  std::optional<int> max_batch_delay;
  std::optional<int> response_timeout;

  DeviceType device_type = DeviceType::None;
  std::vector<int> device_ids;
  int parallel_level = 1;
  ParallelType parallel_type = ParallelType::None;

  int max_retry_timeout_in_sec = kDefaultMaxRetryTimeoutSec;
  int64_t client_timeout_in_mills = 0;
  int job_queue_size = 0;
  bool use_job_ticket = false;

  bool valid = true;
};

}  // namespace model_batcher
