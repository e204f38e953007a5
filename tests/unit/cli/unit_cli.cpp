#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "test_cli.hpp"
#include "test_helpers.hpp"
#include "utils/logger.hpp"

TEST(ArgsParser_Unit, DefaultsWithoutOptions)
{
  const auto opts = parse({"program"});
  ASSERT_TRUE(opts.valid);
  EXPECT_FALSE(opts.show_help);
  EXPECT_TRUE(opts.config_path.empty());
  EXPECT_TRUE(opts.model_config_path.empty());
  EXPECT_EQ(opts.requests, 1000);
  EXPECT_EQ(opts.workers, 4);
  EXPECT_FALSE(opts.batch_size.has_value());
  EXPECT_FALSE(opts.max_batch_delay_ms.has_value());
  EXPECT_FALSE(opts.queue_size.has_value());
  EXPECT_EQ(opts.describe_every, 0);
  EXPECT_FALSE(opts.client_timeout_ms.has_value());
  EXPECT_EQ(opts.producer_delay_us, 0);
  EXPECT_FALSE(opts.metrics_port.has_value());
  EXPECT_FALSE(opts.verbosity.has_value());
}

TEST(ArgsParser_Unit, ParsesAllOptions)
{
  const auto& config = test_config_path();
  const auto& model_config = test_model_config_path();
  std::vector<const char*> args{
      "program",           "--config",           config.c_str(),
      "--model-config",    model_config.c_str(), "--requests",
      "250",               "--workers",          "3",
      "--batch-size",      "8",                  "--max-batch-delay",
      "0",                 "--queue-size",       "64",
      "--describe-every",  "10",                 "--client-timeout-ms",
      "1500",              "--producer-delay-us", "20",
      "--metrics-port",    "9100",               "--verbose",
      "debug"};

  const auto opts = parse(args);
  ASSERT_TRUE(opts.valid);
  EXPECT_EQ(opts.config_path, config);
  EXPECT_EQ(opts.model_config_path, model_config);
  EXPECT_EQ(opts.requests, 250);
  EXPECT_EQ(opts.workers, 3);
  EXPECT_EQ(opts.batch_size, 8);
  EXPECT_EQ(opts.max_batch_delay_ms, 0);
  EXPECT_EQ(opts.queue_size, 64);
  EXPECT_EQ(opts.describe_every, 10);
  EXPECT_EQ(opts.client_timeout_ms, int64_t{1500});
  EXPECT_EQ(opts.producer_delay_us, 20);
  EXPECT_EQ(opts.metrics_port, 9100);
  EXPECT_EQ(opts.verbosity, model_batcher::VerbosityLevel::Debug);
}

TEST(ArgsParser_Unit, ShortConfigAlias)
{
  const auto& config = test_config_path();
  const auto opts = parse({"program", "-c", config.c_str()});
  ASSERT_TRUE(opts.valid);
  EXPECT_EQ(opts.config_path, config);
}

TEST(ArgsParser_Unit, HelpStopsParsing)
{
  const auto opts = parse({"program", "--help", "--unknown"});
  EXPECT_TRUE(opts.valid);
  EXPECT_TRUE(opts.show_help);

  EXPECT_TRUE(parse({"program", "-h"}).show_help);
}

TEST(ArgsParser_Unit, NumericVerbosity)
{
  const auto opts = parse({"program", "--verbose", "4"});
  ASSERT_TRUE(opts.valid);
  EXPECT_EQ(opts.verbosity, model_batcher::VerbosityLevel::Trace);
}

TEST(ArgsParser_Unit, HelpMessageListsOptions)
{
  const auto msg = model_batcher::get_help_message("model_batcher_sim");
  EXPECT_EQ(msg.rfind("Usage: model_batcher_sim [OPTIONS]", 0), 0U);
  for (const char* flag :
       {"--config", "--model-config", "--requests", "--workers",
        "--batch-size", "--max-batch-delay", "--queue-size",
        "--describe-every", "--client-timeout-ms", "--producer-delay-us",
        "--metrics-port", "--verbose", "--help"}) {
    EXPECT_NE(msg.find(flag), std::string::npos) << flag;
  }
}

TEST(ArgsParser_Unit, DisplayHelpLogsMessage)
{
  model_batcher::CaptureStream capture{std::cout};
  model_batcher::display_help("model_batcher_sim");
  EXPECT_EQ(
      capture.str(),
      model_batcher::expected_log_line(
          model_batcher::VerbosityLevel::Info,
          model_batcher::get_help_message("model_batcher_sim")));
}
