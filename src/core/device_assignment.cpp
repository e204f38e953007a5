#include "device_assignment.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <span>

#include "utils/logger.hpp"

namespace model_batcher {

auto
find_invalid_device_id(std::span<const int> device_ids, int gpu_count)
    -> std::optional<int>
{
  const auto invalid_it =
      std::ranges::find_if(device_ids, [gpu_count](const int device_id) {
        return device_id < 0 || device_id >= gpu_count;
      });
  if (invalid_it == device_ids.end()) {
    return std::nullopt;
  }
  return *invalid_it;
}

auto
resolve_device_assignment(
    const std::optional<ModelConfig>& config, int gpu_count) -> DeviceAssignment
{
  DeviceAssignment assignment;
  assignment.device_type = gpu_count > 0 ? DeviceType::GPU : DeviceType::CPU;

  if (config.has_value()) {
    if (config->parallel_level > 1 &&
        config->parallel_type != ParallelType::None) {
      assignment.parallel_level = config->parallel_level;
      assignment.parallel_type = config->parallel_type;
    }

    if (config->device_type != DeviceType::None) {
      assignment.device_type =
          (config->device_type == DeviceType::GPU && gpu_count > 0)
              ? DeviceType::GPU
              : DeviceType::CPU;
    }

    assignment.device_ids = config->device_ids;
    if (!assignment.device_ids.empty()) {
      assignment.has_cfg_device_ids = true;
      if (const auto invalid =
              find_invalid_device_id(assignment.device_ids, gpu_count)) {
        log_warning(std::format(
            "Invalid deviceId:{}, ignore deviceIds list", *invalid));
        assignment.device_ids.clear();
        assignment.has_cfg_device_ids = false;
      }
    }
  }

  if (gpu_count > 0 && assignment.device_type != DeviceType::CPU) {
    assignment.num_cores =
        assignment.has_cfg_device_ids
            ? static_cast<int>(assignment.device_ids.size())
            : gpu_count;
  }
  return assignment;
}

}  // namespace model_batcher
