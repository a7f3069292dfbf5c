#include "tinyweb/route-config.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string_view>

#include "tinyweb/http-method.hpp"
#include "tinyweb/string-equal-ignore-case.hpp"

namespace tinyweb {

RouteConfig& RouteConfig::withMethods(http::MethodBmp methodBmp) {
  methods = methodBmp;
  return *this;
}

RouteConfig& RouteConfig::withSaveHeaders(std::initializer_list<std::string_view> headerNames) {
  saveHeaders.clear();
  for (std::string_view headerName : headerNames) {
    addSaveHeader(headerName);
  }
  return *this;
}

RouteConfig& RouteConfig::addSaveHeader(std::string_view headerName) {
  if (!isHeaderSaved(headerName)) {
    saveHeaders.emplace_back(headerName);
  }
  return *this;
}

RouteConfig& RouteConfig::withMaxBodySize(std::size_t maxBodySize) {
  this->maxBodySize = maxBodySize;
  return *this;
}

RouteConfig& RouteConfig::withParseHeaders(bool on) {
  parseHeaders = on;
  return *this;
}

RouteConfig& RouteConfig::withAllowedAccessControlHeaders(std::string_view value) {
  allowedAccessControlHeaders = value;
  return *this;
}

RouteConfig& RouteConfig::withAllowedAccessControlOrigins(std::string_view value) {
  allowedAccessControlOrigins = value;
  return *this;
}

bool RouteConfig::isHeaderSaved(std::string_view headerName) const noexcept {
  return std::ranges::any_of(saveHeaders, [headerName](std::string_view saved) {
    return CaseInsensitiveEqual(saved, headerName);
  });
}

void RouteConfig::validate() const {
  if (methods == 0) {
    throw std::invalid_argument("Route should accept at least one method");
  }
  for (std::string_view headerName : saveHeaders) {
    if (headerName.empty() || headerName.find_first_of(" \t:\r\n") != std::string_view::npos) {
      throw std::invalid_argument("Invalid header name in saveHeaders");
    }
  }
}

}  // namespace tinyweb
