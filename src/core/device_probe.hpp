#pragma once

#include <optional>

namespace model_batcher::detail {

// Fixes the value get_cuda_device_count() reports; std::nullopt restores the
// runtime query.
void set_cuda_device_count_override(std::optional<int> override_count);
auto get_cuda_device_count() -> int;

}  // namespace model_batcher::detail
