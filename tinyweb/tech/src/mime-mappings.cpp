#include "tinyweb/mime-mappings.hpp"

#include <algorithm>
#include <iterator>
#include <string_view>

namespace tinyweb {

std::string_view MIMETypeForPath(std::string_view path) noexcept {
  const auto slashPos = path.rfind('/');
  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || (slashPos != std::string_view::npos && dotPos < slashPos)) {
    return kDefaultMIMEType;
  }
  const std::string_view ext = path.substr(dotPos + 1);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return it->mimeType;
  }
  return kDefaultMIMEType;
}

}  // namespace tinyweb
