#include "archive_utils.hpp"

#include <string>
#include <string_view>

namespace model_batcher::archive_utils {

auto
get_filename_from_url(std::string_view url) -> std::string
{
  std::string_view path = url;
  if (const auto scheme_end = path.find("://");
      scheme_end != std::string_view::npos) {
    path.remove_prefix(scheme_end + 3);
    const auto authority_end = path.find('/');
    if (authority_end == std::string_view::npos) {
      return {};
    }
    path.remove_prefix(authority_end);
    if (const auto suffix = path.find_first_of("?#");
        suffix != std::string_view::npos) {
      path = path.substr(0, suffix);
    }
  }

  if (const auto separator = path.find_last_of("/\\");
      separator != std::string_view::npos) {
    path.remove_prefix(separator + 1);
  }
  return std::string(path);
}

}  // namespace model_batcher::archive_utils
