#include "tinyweb/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "tinyweb/string-equal-ignore-case.hpp"

namespace tinyweb {

std::optional<std::string_view> HttpRequest::header(std::string_view name) const noexcept {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

std::optional<std::string> HttpRequest::queryParam(std::string_view name) const {
  for (auto& [paramName, value] : ParseQueryString(_queryString)) {
    if (paramName == name) {
      return std::move(value);
    }
  }
  return std::nullopt;
}

}  // namespace tinyweb
