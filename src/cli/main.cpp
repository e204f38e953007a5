#include <torch/version.h>

#include <exception>
#include <format>
#include <span>
#include <string>
#include <string_view>

#include "args_parser.hpp"
#include "batching_simulation.hpp"
#include "core/device_probe.hpp"
#include "monitoring/metrics.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

auto
main(int argc, char* argv[]) -> int
{
  std::span<char*> args_span(argv, static_cast<size_t>(argc));

  auto opts = model_batcher::parse_arguments(args_span);

  if (opts.show_help) {
    model_batcher::display_help("model_batcher_sim");
    return 0;
  }

  if (!opts.valid) {
    model_batcher::log_fatal("Invalid program options.\n");
  }

  try {
    const int available_gpus = model_batcher::detail::get_cuda_device_count();
    model_batcher::RuntimeConfig runtime;
    runtime.number_of_gpu = available_gpus;
    if (!opts.config_path.empty()) {
      runtime =
          model_batcher::load_runtime_config(opts.config_path, available_gpus);
      if (!runtime.valid) {
        model_batcher::log_fatal("Invalid runtime configuration.\n");
      }
    }
    if (opts.verbosity.has_value()) {
      runtime.verbosity = *opts.verbosity;
    }

    model_batcher::log_info(
        runtime.verbosity, std::format("__cplusplus = {}", __cplusplus));
    model_batcher::log_info(
        runtime.verbosity, std::format("LibTorch version: {}", TORCH_VERSION));
    model_batcher::log_info(
        runtime.verbosity,
        std::format("GPUs            : {}", runtime.number_of_gpu));
    model_batcher::log_info(
        runtime.verbosity, std::format("Requests        : {}", opts.requests));

    if (opts.metrics_port.has_value()) {
      runtime.metrics_port = *opts.metrics_port;
      model_batcher::init_metrics(runtime.metrics_port);
    }

    const auto stats = model_batcher::run_batching_simulation(opts, runtime);
    model_batcher::log_simulation_stats(stats, runtime.verbosity);
    model_batcher::shutdown_metrics();
  }
  catch (const model_batcher::ModelBatcherException& e) {
    model_batcher::log_error(std::format("Batching Error: {}", e.what()));
    return 2;
  }
  catch (const std::exception& e) {
    model_batcher::log_error(std::format("General Error: {}", e.what()));
    return -1;
  }

  return 0;
}
