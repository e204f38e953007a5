#pragma once

#include <string>
#include <string_view>

namespace model_batcher::archive_utils {

// Last path component of a model URL or local path: scheme, authority,
// query and fragment are ignored ("https://host/models/resnet.mar?x=1"
// -> "resnet.mar").
auto get_filename_from_url(std::string_view url) -> std::string;

}  // namespace model_batcher::archive_utils
