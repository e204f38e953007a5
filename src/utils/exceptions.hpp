#pragma once

#include <stdexcept>
#include <string>

namespace model_batcher {
// =============================================================================
// Base class for all batching-core exceptions
// =============================================================================

class ModelBatcherException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// =============================================================================
// Specific exception types for common failure cases
// =============================================================================

/// Thrown when a blocking poll is cancelled through its stop token
class PollCancelledException : public ModelBatcherException {
 public:
  using ModelBatcherException::ModelBatcherException;
};

/// Thrown when the runtime reports an unusable GPU count
class InvalidGpuDeviceException : public ModelBatcherException {
 public:
  using ModelBatcherException::ModelBatcherException;
};

/// Thrown when a configuration file cannot be turned into a usable config
class ConfigLoadingException : public ModelBatcherException {
 public:
  using ModelBatcherException::ModelBatcherException;
};

}  // namespace model_batcher
