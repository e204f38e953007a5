#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "device_type.hpp"
#include "logger.hpp"
#include "transparent_hash.hpp"

namespace model_batcher {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

using KeySet = std::unordered_set<std::string, TransparentHash, std::equal_to<>>;

// Reads root[key] as an int and checks it against a lower bound.
auto
read_bounded_int(const YAML::Node& root, const char* key, int min_value) -> int
{
  const int value = root[key].as<int>();
  if (value < min_value) {
    throw std::invalid_argument(
        std::format("{} must be >= {}", key, min_value));
  }
  return value;
}

// =============================================================================
// Runtime (server) configuration
// =============================================================================

auto
validate_runtime_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  static const KeySet kAllowedKeys{
      "verbose",
      "verbosity",
      "number_of_gpu",
      "debug",
      "job_queue_size",
      "default_response_timeout",
      "default_workers_per_model",
      "default_batch_size",
      "default_max_batch_delay",
      "metrics_port"};

  for (const auto& kvalue : root) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (!kAllowedKeys.contains(key)) {
      log_error(std::string("Unknown configuration option: ") + key);
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

void
parse_runtime_verbosity(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["verbose"]) {
    cfg.verbosity = parse_verbosity_level(root["verbose"].as<std::string>());
  } else if (root["verbosity"]) {
    cfg.verbosity = parse_verbosity_level(root["verbosity"].as<std::string>());
  }
}

void
parse_runtime_devices(
    const YAML::Node& root, RuntimeConfig& cfg, int available_gpus)
{
  cfg.number_of_gpu = available_gpus;
  if (root["number_of_gpu"]) {
    const int requested = read_bounded_int(root, "number_of_gpu", 0);
    if (requested > available_gpus) {
      log_warning(std::format(
          "number_of_gpu {} exceeds the {} GPU(s) available; using {}",
          requested, available_gpus, available_gpus));
    }
    cfg.number_of_gpu = std::min(requested, available_gpus);
  }
  if (root["debug"]) {
    cfg.debug = root["debug"].as<bool>();
  }
}

void
parse_runtime_defaults(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["job_queue_size"]) {
    cfg.job_queue_size = read_bounded_int(root, "job_queue_size", 1);
  }
  if (root["default_response_timeout"]) {
    cfg.defaults.response_timeout_sec =
        read_bounded_int(root, "default_response_timeout", 0);
  }
  if (root["default_workers_per_model"]) {
    cfg.defaults.workers_per_model =
        read_bounded_int(root, "default_workers_per_model", 0);
  }
  if (root["default_batch_size"]) {
    cfg.defaults.batch_size = read_bounded_int(root, "default_batch_size", 1);
  }
  if (root["default_max_batch_delay"]) {
    cfg.defaults.max_batch_delay_ms =
        read_bounded_int(root, "default_max_batch_delay", 0);
  }
  if (root["metrics_port"]) {
    cfg.metrics_port = root["metrics_port"].as<int>();
    if (cfg.metrics_port < kMinPort || cfg.metrics_port > kMaxPort) {
      log_error("metrics_port must be between 1 and 65535");
      cfg.valid = false;
    }
  }
}

// =============================================================================
// Model archive configuration (model-config.yaml)
// =============================================================================

void
warn_unused_model_keys(const YAML::Node& root)
{
  static const KeySet kKnownKeys{
      "minWorkers",           "maxWorkers",     "batchSize",
      "maxBatchDelay",        "responseTimeout", "deviceType",
      "deviceIds",            "parallelLevel",  "parallelType",
      "maxRetryTimeoutInSec", "clientTimeoutInMills", "jobQueueSize",
      "useJobTicket"};

  for (const auto& kvalue : root) {
    if (kvalue.first.IsScalar() &&
        !kKnownKeys.contains(kvalue.first.as<std::string>())) {
      log_warning(std::format(
          "Model config key '{}' is not used by the batching core",
          kvalue.first.as<std::string>()));
    }
  }
}

void
parse_model_workers_and_batching(const YAML::Node& root, ModelConfig& cfg)
{
  if (root["minWorkers"]) {
    cfg.min_workers = read_bounded_int(root, "minWorkers", 0);
  }
  if (root["maxWorkers"]) {
    cfg.max_workers = read_bounded_int(root, "maxWorkers", 0);
  }
  if (cfg.min_workers && cfg.max_workers &&
      *cfg.max_workers < *cfg.min_workers) {
    throw std::invalid_argument("maxWorkers must be >= minWorkers");
  }
  if (root["batchSize"]) {
    cfg.batch_size = read_bounded_int(root, "batchSize", 1);
  }
  if (root["maxBatchDelay"]) {
    cfg.max_batch_delay = read_bounded_int(root, "maxBatchDelay", 0);
  }
  if (root["responseTimeout"]) {
    cfg.response_timeout = read_bounded_int(root, "responseTimeout", 0);
  }
}

void
parse_model_devices(const YAML::Node& root, ModelConfig& cfg)
{
  if (root["deviceType"]) {
    cfg.device_type = parse_device_type(root["deviceType"].as<std::string>());
  }
  if (const YAML::Node ids_node = root["deviceIds"]; ids_node) {
    if (!ids_node.IsSequence()) {
      throw std::invalid_argument("deviceIds must be a sequence");
    }
    cfg.device_ids = ids_node.as<std::vector<int>>();
  }
  if (root["parallelLevel"]) {
    cfg.parallel_level = read_bounded_int(root, "parallelLevel", 1);
  }
  if (root["parallelType"]) {
    cfg.parallel_type =
        parse_parallel_type(root["parallelType"].as<std::string>());
  }
}

void
parse_model_timeouts_and_admission(const YAML::Node& root, ModelConfig& cfg)
{
  if (root["maxRetryTimeoutInSec"]) {
    cfg.max_retry_timeout_in_sec =
        read_bounded_int(root, "maxRetryTimeoutInSec", 0);
  }
  if (root["clientTimeoutInMills"]) {
    const auto tmp = root["clientTimeoutInMills"].as<long long>();
    if (tmp < 0) {
      throw std::invalid_argument("clientTimeoutInMills must be >= 0");
    }
    cfg.client_timeout_in_mills = static_cast<int64_t>(tmp);
  }
  if (root["jobQueueSize"]) {
    cfg.job_queue_size = read_bounded_int(root, "jobQueueSize", 0);
  }
  if (root["useJobTicket"]) {
    cfg.use_job_ticket = root["useJobTicket"].as<bool>();
  }
}

}  // namespace

auto
load_runtime_config(const std::string& path, int available_gpus)
    -> RuntimeConfig
{
  RuntimeConfig cfg;
  cfg.config_path = path;
  cfg.number_of_gpu = std::max(available_gpus, 0);
  const auto mark_invalid = [&cfg](const std::string& message) {
    log_error(std::string("Failed to load config: ") + message);
    cfg.valid = false;
  };
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (!root || !root.IsMap()) {
      log_error("Config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    parse_runtime_verbosity(root, cfg);
    if (!validate_runtime_keys(root, cfg)) {
      return cfg;
    }
    parse_runtime_devices(root, cfg, cfg.number_of_gpu);
    parse_runtime_defaults(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }
  return cfg;
}

auto
load_model_config(const std::string& path) -> ModelConfig
{
  ModelConfig cfg;
  const auto mark_invalid = [&cfg, &path](const std::string& message) {
    log_error(std::format("Failed to load model config {}: {}", path, message));
    cfg.valid = false;
  };
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (!root || !root.IsMap()) {
      log_error("Model config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    warn_unused_model_keys(root);
    parse_model_workers_and_batching(root, cfg);
    parse_model_devices(root, cfg);
    parse_model_timeouts_and_admission(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }
  return cfg;
}

}  // namespace model_batcher
