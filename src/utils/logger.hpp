#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace model_batcher {
// Logging utilities
// -----------------
// Every write to stdout/stderr takes the global log mutex so lines emitted
// by producer and worker threads never interleave.

inline std::mutex log_mutex;

enum class VerbosityLevel : std::uint8_t {
  Silent = 0,
  Info = 1,
  Stats = 2,
  Debug = 3,
  Trace = 4
};

// =============================================================================
// Utility: parse verbosity level from string or number
// =============================================================================

inline auto
parse_verbosity_level(const std::string& val) -> VerbosityLevel
{
  using enum VerbosityLevel;
  static constexpr std::array<std::pair<std::string_view, VerbosityLevel>, 5>
      kNamedLevels{{
          {"silent", Silent},
          {"info", Info},
          {"stats", Stats},
          {"debug", Debug},
          {"trace", Trace},
      }};

  const auto first = val.find_first_not_of(" \t\n\r\f\v");
  const auto last = val.find_last_not_of(" \t\n\r\f\v");
  const std::string trimmed = first == std::string::npos
                                  ? std::string{}
                                  : val.substr(first, last - first + 1);
  if (trimmed.empty()) {
    throw std::invalid_argument("Invalid verbosity level: " + trimmed);
  }

  if (std::ranges::all_of(
          trimmed, [](unsigned char c) { return std::isdigit(c) != 0; })) {
    int level{};
    try {
      level = std::stoi(trimmed);
    }
    catch (const std::out_of_range&) {
      throw std::invalid_argument("Verbosity level out of range: " + trimmed);
    }
    if (level < 0 || level >= static_cast<int>(kNamedLevels.size())) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    return kNamedLevels[static_cast<std::size_t>(level)].second;
  }

  std::string lower(trimmed.size(), '\0');
  std::ranges::transform(trimmed, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  const auto named = std::ranges::find_if(
      kNamedLevels, [&lower](const auto& entry) { return entry.first == lower; });
  if (named == kNamedLevels.end()) {
    throw std::invalid_argument("Invalid verbosity level: " + trimmed);
  }
  return named->second;
}

// =============================================================================
// Utility: color and label mapping for verbosity levels
// =============================================================================

inline auto
verbosity_style(const VerbosityLevel level)
    -> std::pair<const char*, const char*>
{
  using enum VerbosityLevel;
  switch (level) {
    case Info:
      return {"\x1b[1;32m", "[INFO] "};  // Green
    case Stats:
      return {"\x1b[1;35m", "[STATS] "};  // Magenta
    case Debug:
      return {"\x1b[1;34m", "[DEBUG] "};  // Blue
    case Trace:
      return {"\x1b[1;90m", "[TRACE] "};  // Gray
    default:
      return {"", ""};
  }
}

[[nodiscard]] inline auto
should_log(const VerbosityLevel level, const VerbosityLevel current_level)
    -> bool
{
  return std::to_underlying(current_level) >= std::to_underlying(level);
}

// =============================================================================
// Verbosity-controlled logging
// =============================================================================

inline void
log_verbose(
    const VerbosityLevel level, const VerbosityLevel current_level,
    const std::string& message)
{
  if (!should_log(level, current_level)) {
    return;
  }
  auto [color, label] = verbosity_style(level);
  const std::scoped_lock lock(log_mutex);
  std::cout << color << label << message << "\x1b[0m\n" << std::flush;
}

inline void
log_info(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Info, lvl, msg);
}

inline void
log_stats(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Stats, lvl, msg);
}

inline void
log_debug(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Debug, lvl, msg);
}

inline void
log_trace(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Trace, lvl, msg);
}

// =============================================================================
// Unconditional stderr logging
// =============================================================================

inline void
log_warning(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;33m[WARNING] " << message << "\x1b[0m\n" << std::flush;
}

inline void
log_error(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;31m[ERROR] " << message << "\x1b[0m\n" << std::flush;
}

[[noreturn]] inline void
log_fatal(const std::string& message)
{
  {
    const std::scoped_lock lock(log_mutex);
    std::cerr << "\x1b[1;41m[FATAL] " << message << "\x1b[0m\n";
  }
  std::terminate();
}
}  // namespace model_batcher
