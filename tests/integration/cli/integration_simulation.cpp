#include <gtest/gtest.h>

#include <cstddef>
#include <string>

#include "cli/args_parser.hpp"
#include "cli/batching_simulation.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"
#include "utils/runtime_config.hpp"

namespace model_batcher { namespace {

auto
small_simulation() -> SimulationOptions
{
  SimulationOptions opts;
  opts.requests = 60;
  opts.workers = 2;
  opts.batch_size = 4;
  opts.max_batch_delay_ms = 5;
  opts.queue_size = 1000;
  return opts;
}

}  // namespace

TEST(BatchingSimulation_Integration, EveryAcceptedRequestIsServed)
{
  auto opts = small_simulation();
  opts.describe_every = 10;

  const auto stats = run_batching_simulation(opts, RuntimeConfig{});

  EXPECT_EQ(stats.submitted, 60U);
  EXPECT_EQ(stats.accepted, 60U);
  EXPECT_EQ(stats.rejected, 0U);
  EXPECT_EQ(stats.control_jobs, 2U);
  EXPECT_EQ(stats.dropped(), 0U);
  EXPECT_EQ(stats.batched_jobs + stats.left_in_queue, stats.accepted);
  EXPECT_LE(stats.describe_jobs, 6U);
  EXPECT_GE(stats.batches * 4, stats.batched_jobs);
  EXPECT_LE(stats.mean_batch_size(), 4.0);
}

TEST(BatchingSimulation_Integration, ModelConfigDrivesBatching)
{
  const auto path = write_temp_file(
      "sim_model_config.yaml",
      "batchSize: 2\n"
      "maxBatchDelay: 1\n"
      "jobQueueSize: 500\n");
  SimulationOptions opts;
  opts.requests = 40;
  opts.workers = 1;
  opts.model_config_path = path.string();

  const auto stats = run_batching_simulation(opts, RuntimeConfig{});

  EXPECT_EQ(stats.accepted, 40U);
  EXPECT_EQ(stats.batched_jobs + stats.left_in_queue, stats.accepted);
  EXPECT_GE(stats.batches * 2, stats.batched_jobs);
  EXPECT_LE(stats.mean_batch_size(), 2.0);
}

TEST(BatchingSimulation_Integration, InvalidModelConfigThrows)
{
  const auto path =
      write_temp_file("sim_model_config_invalid.yaml", "batchSize: 0\n");
  SimulationOptions opts;
  opts.model_config_path = path.string();

  CaptureStream capture{std::cerr};
  EXPECT_THROW(
      run_batching_simulation(opts, RuntimeConfig{}), ConfigLoadingException);
}

TEST(BatchingSimulation_Integration, StatsAreLoggedAtStatsLevel)
{
  SimulationStats stats;
  stats.submitted = 10;
  stats.accepted = 8;
  stats.rejected = 2;
  stats.batches = 4;
  stats.batched_jobs = 8;

  CaptureStream capture{std::cout};
  log_simulation_stats(stats, VerbosityLevel::Stats);

  const std::string expected =
      expected_log_line(
          VerbosityLevel::Stats,
          "Requests: 10 submitted, 8 accepted, 2 rejected") +
      expected_log_line(
          VerbosityLevel::Stats,
          "Batches: 4 (mean size 2.00), 0 describe, 0 control") +
      expected_log_line(
          VerbosityLevel::Stats,
          "Dropped on client timeout: 0, left in queue: 0");
  EXPECT_EQ(capture.str(), expected);

  CaptureStream silent{std::cout};
  log_simulation_stats(stats, VerbosityLevel::Info);
  EXPECT_TRUE(silent.str().empty());
}

}  // namespace model_batcher
