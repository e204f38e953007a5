#include "device_probe.hpp"

#include <torch/cuda.h>

#include <format>
#include <limits>
#include <optional>
#include <stdexcept>

#include "utils/exceptions.hpp"

namespace model_batcher::detail {

namespace {
auto
cuda_device_count_override_storage() -> std::optional<int>&
{
  static std::optional<int> override;
  return override;
}
}  // namespace

void
set_cuda_device_count_override(std::optional<int> override_count)
{
  if (override_count.has_value() && *override_count < 0) {
    throw std::invalid_argument(
        "CUDA device count override must be non-negative");
  }
  cuda_device_count_override_storage() = override_count;
}

auto
get_cuda_device_count() -> int
{
  if (const auto& override = cuda_device_count_override_storage();
      override.has_value()) {
    return *override;
  }

  const auto raw_count = torch::cuda::device_count();
  if (raw_count < 0) {
    throw InvalidGpuDeviceException(
        "torch::cuda::device_count returned a negative value.");
  }
  if (raw_count > std::numeric_limits<int>::max()) {
    throw InvalidGpuDeviceException(std::format(
        "torch::cuda::device_count returned {}, which exceeds int range.",
        raw_count));
  }
  return static_cast<int>(raw_count);
}

}  // namespace model_batcher::detail
