#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "model_config.hpp"

namespace model_batcher {

// What the archive loader hands over for one model version. Loading and
// unpacking archives happens elsewhere.
struct ModelArchive {
  std::string model_name;
  std::string model_version;
  std::string url;
  std::filesystem::path model_dir;
  std::optional<ModelConfig> model_config;
};

}  // namespace model_batcher
