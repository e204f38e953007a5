#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "utils/logger.hpp"

namespace model_batcher {

// =============================================================================
// SimulationOptions: command line of model_batcher_sim
// -----------------------------------------------------------------------------
// Unset optionals keep the value resolved from the YAML files.
// =============================================================================
struct SimulationOptions {
  std::string config_path;
  std::string model_config_path;
  int requests = 1000;
  int workers = 4;
  std::optional<int> batch_size;
  std::optional<int> max_batch_delay_ms;
  std::optional<int> queue_size;
  int describe_every = 0;
  std::optional<int64_t> client_timeout_ms;
  int producer_delay_us = 0;
  std::optional<int> metrics_port;
  std::optional<VerbosityLevel> verbosity;
  bool show_help = false;
  bool valid = true;
};

inline auto
get_help_message(const char* prog_name) -> std::string
{
  std::string msg = "Usage: ";
  msg += prog_name;
  msg +=
      " [OPTIONS]\n"
      "\nOptions:\n"
      "  --config [file]            Runtime YAML configuration file\n"
      "  --model-config [file]      model-config.yaml of the simulated model\n"
      "  --requests N               Number of requests to submit (default: "
      "1000)\n"
      "  --workers N                Number of worker threads (default: 4)\n"
      "  --batch-size N             Override the model batch size\n"
      "  --max-batch-delay [ms]     Override the batch fill budget\n"
      "  --queue-size N             Override the data queue capacity\n"
      "  --describe-every N         Send a describe request every N requests\n"
      "                             (default: 0, never)\n"
      "  --client-timeout-ms [ms]   Client deadline of each request (0: none)\n"
      "  --producer-delay-us [us]   Delay between submitted requests "
      "(default: 0)\n"
      "  --metrics-port [port]      Expose Prometheus metrics on this port\n"
      "  --verbose [0-4]            Verbosity level: 0=silent to 4=trace\n"
      "  --help                     Show this help message\n";
  return msg;
}

inline void
display_help(const char* prog_name)
{
  log_info(VerbosityLevel::Info, get_help_message(prog_name));
}

auto parse_arguments(std::span<char*> args_span, SimulationOptions opts = {})
    -> SimulationOptions;
}  // namespace model_batcher
