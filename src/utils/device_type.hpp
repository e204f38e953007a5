#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace model_batcher {
// =============================================================================
// DeviceType: where the workers of a model version execute.
// None means "not specified" in a model config and never survives device
// resolution.
// =============================================================================

enum class DeviceType : uint8_t { None, CPU, GPU };

inline auto
to_string(DeviceType type) -> const char*
{
  using enum DeviceType;
  switch (type) {
    case None:
      return "None";
    case CPU:
      return "CPU";
    case GPU:
      return "GPU";
    default:
      return "InvalidDeviceType";
  }
}

inline auto
parse_device_type(const std::string& value) -> DeviceType
{
  std::string lower(value.size(), '\0');
  std::ranges::transform(value, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "cpu") {
    return DeviceType::CPU;
  }
  if (lower == "gpu") {
    return DeviceType::GPU;
  }
  if (lower.empty() || lower == "none") {
    return DeviceType::None;
  }
  throw std::invalid_argument("Unknown device type: " + value);
}
}  // namespace model_batcher
