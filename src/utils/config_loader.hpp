#pragma once
#include <string>

#include "core/model_config.hpp"
#include "runtime_config.hpp"

namespace model_batcher {

// Server settings. number_of_gpu defaults to, and is capped by,
// available_gpus.
auto load_runtime_config(const std::string& path, int available_gpus)
    -> RuntimeConfig;

// model-config.yaml shipped inside a model archive. Keys this core does not
// consume (handler sections and the like) are skipped.
auto load_model_config(const std::string& path) -> ModelConfig;

}  // namespace model_batcher
