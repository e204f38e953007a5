#include <gtest/gtest.h>

#include <iostream>
#include <optional>
#include <vector>

#include "core/device_assignment.hpp"
#include "test_helpers.hpp"

using namespace model_batcher;

TEST(DeviceAssignment_Unit, NoConfigUsesEveryGpu)
{
  const auto assignment = resolve_device_assignment(std::nullopt, 4);
  EXPECT_EQ(assignment.device_type, DeviceType::GPU);
  EXPECT_EQ(assignment.num_cores, 4);
  EXPECT_FALSE(assignment.has_cfg_device_ids);
  EXPECT_TRUE(assignment.device_ids.empty());
  EXPECT_EQ(assignment.parallel_level, 1);
  EXPECT_EQ(assignment.parallel_type, ParallelType::None);
}

TEST(DeviceAssignment_Unit, NoGpuMeansCpu)
{
  const auto assignment = resolve_device_assignment(std::nullopt, 0);
  EXPECT_EQ(assignment.device_type, DeviceType::CPU);
  EXPECT_EQ(assignment.num_cores, 0);
}

TEST(DeviceAssignment_Unit, GpuRequestWithoutGpuFallsBackToCpu)
{
  ModelConfig config;
  config.device_type = DeviceType::GPU;
  const auto assignment = resolve_device_assignment(config, 0);
  EXPECT_EQ(assignment.device_type, DeviceType::CPU);
  EXPECT_EQ(assignment.num_cores, 0);
}

TEST(DeviceAssignment_Unit, CpuRequestIgnoresGpus)
{
  ModelConfig config;
  config.device_type = DeviceType::CPU;
  const auto assignment = resolve_device_assignment(config, 2);
  EXPECT_EQ(assignment.device_type, DeviceType::CPU);
  EXPECT_EQ(assignment.num_cores, 0);
}

TEST(DeviceAssignment_Unit, ValidDeviceIdsBoundCoreCount)
{
  ModelConfig config;
  config.device_ids = {1, 3};
  const auto assignment = resolve_device_assignment(config, 4);
  EXPECT_EQ(assignment.device_type, DeviceType::GPU);
  EXPECT_TRUE(assignment.has_cfg_device_ids);
  EXPECT_EQ(assignment.device_ids, (std::vector<int>{1, 3}));
  EXPECT_EQ(assignment.num_cores, 2);
}

TEST(DeviceAssignment_Unit, InvalidDeviceIdDiscardsTheWholeList)
{
  ModelConfig config;
  config.device_ids = {0, 5};
  CaptureStream capture{std::cerr};
  const auto assignment = resolve_device_assignment(config, 2);

  EXPECT_FALSE(assignment.has_cfg_device_ids);
  EXPECT_TRUE(assignment.device_ids.empty());
  EXPECT_EQ(assignment.num_cores, 2);
  EXPECT_EQ(
      capture.str(),
      expected_log_line(
          WarningLevel, "Invalid deviceId:5, ignore deviceIds list"));
}

TEST(DeviceAssignment_Unit, ParallelismNeedsLevelAndType)
{
  ModelConfig config;
  config.parallel_level = 4;
  EXPECT_EQ(resolve_device_assignment(config, 4).parallel_level, 1);

  config.parallel_type = ParallelType::TP;
  const auto assignment = resolve_device_assignment(config, 4);
  EXPECT_EQ(assignment.parallel_level, 4);
  EXPECT_EQ(assignment.parallel_type, ParallelType::TP);
}

TEST(DeviceAssignment_Unit, FindInvalidDeviceId)
{
  const std::vector<int> ids{0, 1, -1, 7};
  EXPECT_EQ(find_invalid_device_id(ids, 2), -1);
  EXPECT_FALSE(find_invalid_device_id(std::vector<int>{0, 1}, 2).has_value());
  EXPECT_FALSE(find_invalid_device_id(std::vector<int>{}, 0).has_value());
}
