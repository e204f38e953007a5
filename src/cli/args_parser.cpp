#include "args_parser.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "utils/logger.hpp"
#include "utils/transparent_hash.hpp"

namespace model_batcher {
constexpr int kPortMin = 1;
constexpr int kPortMax = 65535;

// =============================================================================
// Argument Parsing Utilities
// =============================================================================

static auto
missing_value_error(std::string_view option_name) -> bool
{
  log_error(std::format("{} option requires a value.", option_name));
  return false;
}

template <typename Func>
auto
try_parse(const char* val, Func&& parser) -> bool
{
  try {
    std::forward<Func>(parser)(val);
    return true;
  }
  catch (const std::invalid_argument& e) {
    log_error(e.what());
  }
  catch (const std::out_of_range& e) {
    log_error(e.what());
  }
  return false;
}

template <typename Func>
auto
expect_and_parse(
    std::string_view option_name, size_t& idx, std::span<char*> args,
    Func&& parser) -> bool
{
  if (idx + 1 >= args.size()) {
    return missing_value_error(option_name);
  }
  ++idx;
  return try_parse(args[idx], std::forward<Func>(parser));
}

static auto
parse_int_at_least(const char* val, int min_value) -> int
{
  const int tmp = std::stoi(val);
  if (tmp < min_value) {
    throw std::invalid_argument(std::format("Must be >= {}.", min_value));
  }
  return tmp;
}

// =============================================================================
// Individual Argument Parsers
// =============================================================================

static auto
parse_existing_path(
    std::string_view option_name, std::string& target, size_t& idx,
    std::span<char*> args) -> bool
{
  if (idx + 1 >= args.size()) {
    return missing_value_error(option_name);
  }
  ++idx;
  target = args[idx];
  if (!std::filesystem::exists(target)) {
    log_error(std::format("Config file not found: {}", target));
    return false;
  }
  return true;
}

static auto
parse_config(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  return parse_existing_path("--config", opts.config_path, idx, args);
}

static auto
parse_model_config(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  return parse_existing_path(
      "--model-config", opts.model_config_path, idx, args);
}

static auto
parse_requests(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& requests = opts.requests;
  return expect_and_parse(
      "--requests", idx, args,
      [&requests](const char* val) { requests = parse_int_at_least(val, 1); });
}

static auto
parse_workers(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& workers = opts.workers;
  return expect_and_parse(
      "--workers", idx, args,
      [&workers](const char* val) { workers = parse_int_at_least(val, 1); });
}

static auto
parse_batch_size(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& batch_size = opts.batch_size;
  return expect_and_parse(
      "--batch-size", idx, args, [&batch_size](const char* val) {
        batch_size = parse_int_at_least(val, 1);
      });
}

static auto
parse_max_batch_delay(
    SimulationOptions& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& delay = opts.max_batch_delay_ms;
  return expect_and_parse(
      "--max-batch-delay", idx, args,
      [&delay](const char* val) { delay = parse_int_at_least(val, 0); });
}

static auto
parse_queue_size(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& queue_size = opts.queue_size;
  return expect_and_parse(
      "--queue-size", idx, args, [&queue_size](const char* val) {
        queue_size = parse_int_at_least(val, 1);
      });
}

static auto
parse_describe_every(
    SimulationOptions& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& every = opts.describe_every;
  return expect_and_parse(
      "--describe-every", idx, args,
      [&every](const char* val) { every = parse_int_at_least(val, 0); });
}

static auto
parse_client_timeout(
    SimulationOptions& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& timeout = opts.client_timeout_ms;
  return expect_and_parse(
      "--client-timeout-ms", idx, args, [&timeout](const char* val) {
        const auto tmp = std::stoll(val);
        if (tmp < 0) {
          throw std::invalid_argument("Must be >= 0.");
        }
        timeout = static_cast<int64_t>(tmp);
      });
}

static auto
parse_producer_delay(
    SimulationOptions& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& delay = opts.producer_delay_us;
  return expect_and_parse(
      "--producer-delay-us", idx, args,
      [&delay](const char* val) { delay = parse_int_at_least(val, 0); });
}

static auto
parse_metrics_port(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& metrics_port = opts.metrics_port;
  return expect_and_parse(
      "--metrics-port", idx, args, [&metrics_port](const char* val) {
        const int port = std::stoi(val);
        if (port < kPortMin || port > kPortMax) {
          throw std::out_of_range("Metrics port must be between 1 and 65535.");
        }
        metrics_port = port;
      });
}

static auto
parse_verbose(SimulationOptions& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& verbosity = opts.verbosity;
  return expect_and_parse(
      "--verbose", idx, args, [&verbosity](const char* val) {
        verbosity = parse_verbosity_level(val);
      });
}

// =============================================================================
// Dispatch Argument Parser (Main parser loop)
// =============================================================================

static auto
parse_argument_values(std::span<char*> args_span, SimulationOptions& opts)
    -> bool
{
  using Parser = bool (*)(SimulationOptions&, size_t&, std::span<char*>);
  const static std::unordered_map<
      std::string_view, Parser, TransparentHash, std::equal_to<>>
      dispatch = {
          {"--config", parse_config},
          {"-c", parse_config},
          {"--model-config", parse_model_config},
          {"--requests", parse_requests},
          {"--workers", parse_workers},
          {"--batch-size", parse_batch_size},
          {"--max-batch-delay", parse_max_batch_delay},
          {"--queue-size", parse_queue_size},
          {"--describe-every", parse_describe_every},
          {"--client-timeout-ms", parse_client_timeout},
          {"--producer-delay-us", parse_producer_delay},
          {"--metrics-port", parse_metrics_port},
          {"--verbose", parse_verbose},
      };

  for (size_t idx = 1; idx < args_span.size(); ++idx) {
    const std::string_view arg = args_span[idx];

    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
      return true;
    }
    if (auto iter = dispatch.find(arg); iter != dispatch.end()) {
      if (!iter->second(opts, idx, args_span)) {
        return false;
      }
    } else {
      log_error(std::format(
          "Unknown argument: {}. Use --help to see valid options.", arg));
      return false;
    }
  }

  return true;
}

// =============================================================================
// Top-Level Entry
// =============================================================================

auto
parse_arguments(std::span<char*> args_span, SimulationOptions opts)
    -> SimulationOptions
{
  if (!parse_argument_values(args_span, opts)) {
    opts.valid = false;
  }
  return opts;
}

}  // namespace model_batcher
