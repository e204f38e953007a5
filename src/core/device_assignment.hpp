#pragma once

#include <optional>
#include <span>
#include <vector>

#include "model_config.hpp"
#include "utils/device_type.hpp"
#include "utils/logger.hpp"

namespace model_batcher {

// =============================================================================
// DeviceAssignment: where the workers of one model version may run,
// resolved once from the archive config and the GPUs the runtime reports.
// =============================================================================
struct DeviceAssignment {
  DeviceType device_type = DeviceType::CPU;
  std::vector<int> device_ids;
  bool has_cfg_device_ids = false;
  int num_cores = 0;
  int parallel_level = 1;
  ParallelType parallel_type = ParallelType::None;
};

// First id outside [0, gpu_count), if any.
[[nodiscard]] auto find_invalid_device_id(
    std::span<const int> device_ids, int gpu_count) -> std::optional<int>;

// An invalid device id discards the whole configured list with a warning.
[[nodiscard]] auto resolve_device_assignment(
    const std::optional<ModelConfig>& config,
    int gpu_count) -> DeviceAssignment;

}  // namespace model_batcher
