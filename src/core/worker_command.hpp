#pragma once

#include <cstdint>

namespace model_batcher {
// =============================================================================
// WorkerCommand: what a worker is asked to do with a job.
// =============================================================================

enum class WorkerCommand : uint8_t {
  Predict,
  Load,
  Unload,
  Stats,
  Describe,
  StreamPredict,
  OipPredict
};

inline auto
to_string(WorkerCommand cmd) -> const char*
{
  using enum WorkerCommand;
  switch (cmd) {
    case Predict:
      return "predict";
    case Load:
      return "load";
    case Unload:
      return "unload";
    case Stats:
      return "stats";
    case Describe:
      return "describe";
    case StreamPredict:
      return "streampredict";
    case OipPredict:
      return "oippredict";
    default:
      return "invalid";
  }
}

// Describe and stream-predict jobs always run in a batch of their own.
[[nodiscard]] inline constexpr auto
is_unbatchable(WorkerCommand cmd) noexcept -> bool
{
  return cmd == WorkerCommand::Describe || cmd == WorkerCommand::StreamPredict;
}

}  // namespace model_batcher
