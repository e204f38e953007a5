#pragma once

#include <string>

#include "logger.hpp"

namespace model_batcher {
// =============================================================================
// Process-wide defaults
// =============================================================================
inline constexpr int kDefaultJobQueueSize = 100;
inline constexpr int kDefaultBatchSize = 1;
inline constexpr int kDefaultMaxBatchDelayMs = 100;
inline constexpr int kDefaultResponseTimeoutSec = 120;
inline constexpr int kDefaultMaxRetryTimeoutSec = 300;
inline constexpr int kDefaultMetricsPort = 9090;
inline constexpr int kMillisecondsPerSecond = 1000;

// =============================================================================
// RuntimeConfig
// -----------------------------------------------------------------------------
// Server-level settings a Model consults while it is constructed and
// served. Passed explicitly instead of being read from a global.
//
// Contains:
//   - Runtime facts (GPU count, debug mode)
//   - Defaults applied when a model archive leaves a setting unset
//   - Logging level and metrics endpoint
// =============================================================================
struct RuntimeConfig {
  struct ModelDefaults {
    int workers_per_model = 0;
    int batch_size = kDefaultBatchSize;
    int max_batch_delay_ms = kDefaultMaxBatchDelayMs;
    int response_timeout_sec = kDefaultResponseTimeoutSec;
  };

  std::string config_path;
  int number_of_gpu = 0;
  bool debug = false;
  int job_queue_size = kDefaultJobQueueSize;
  int metrics_port = kDefaultMetricsPort;
  ModelDefaults defaults{};
  VerbosityLevel verbosity = VerbosityLevel::Silent;
  bool valid = true;
};
}  // namespace model_batcher
