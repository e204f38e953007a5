#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

#include "core/device_probe.hpp"

namespace {
class DeviceProbeOverride : public ::testing::Test {
 protected:
  void TearDown() override
  {
    model_batcher::detail::set_cuda_device_count_override(std::nullopt);
  }
};
}  // namespace

TEST_F(DeviceProbeOverride, ReturnsOverriddenCount)
{
  model_batcher::detail::set_cuda_device_count_override(3);
  EXPECT_EQ(model_batcher::detail::get_cuda_device_count(), 3);

  model_batcher::detail::set_cuda_device_count_override(0);
  EXPECT_EQ(model_batcher::detail::get_cuda_device_count(), 0);
}

TEST_F(DeviceProbeOverride, RejectsNegativeOverride)
{
  model_batcher::detail::set_cuda_device_count_override(2);
  EXPECT_THROW(
      model_batcher::detail::set_cuda_device_count_override(-1),
      std::invalid_argument);
  EXPECT_EQ(model_batcher::detail::get_cuda_device_count(), 2);
}

TEST_F(DeviceProbeOverride, ResetQueriesRuntime)
{
  model_batcher::detail::set_cuda_device_count_override(5);
  model_batcher::detail::set_cuda_device_count_override(std::nullopt);
  EXPECT_GE(model_batcher::detail::get_cuda_device_count(), 0);
}
