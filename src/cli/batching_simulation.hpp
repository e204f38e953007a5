#pragma once

#include <cstddef>

#include "args_parser.hpp"
#include "utils/runtime_config.hpp"

namespace model_batcher {

struct SimulationStats {
  std::size_t submitted = 0;
  std::size_t accepted = 0;
  std::size_t rejected = 0;
  std::size_t batches = 0;
  std::size_t batched_jobs = 0;
  std::size_t control_jobs = 0;
  std::size_t describe_jobs = 0;
  std::size_t left_in_queue = 0;

  // Accepted jobs that never reached a worker: dropped on client timeout.
  [[nodiscard]] auto dropped() const -> std::size_t
  {
    const std::size_t served = batched_jobs + left_in_queue;
    return accepted > served ? accepted - served : 0;
  }

  [[nodiscard]] auto mean_batch_size() const -> double
  {
    return batches == 0 ? 0.0
                        : static_cast<double>(batched_jobs) /
                              static_cast<double>(batches);
  }
};

// Runs one producer and opts.workers worker threads against a single model
// until every request was submitted and the data queue drained. Throws
// ConfigLoadingException when the model config cannot be loaded.
auto run_batching_simulation(
    const SimulationOptions& opts, const RuntimeConfig& runtime)
    -> SimulationStats;

void log_simulation_stats(
    const SimulationStats& stats, VerbosityLevel verbosity);

}  // namespace model_batcher
