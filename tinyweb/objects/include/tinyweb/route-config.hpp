#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "tinyweb/http-method.hpp"

namespace tinyweb {

// Per-route policy, fixed at registration time.
struct RouteConfig {
  // Methods accepted on this route. Other methods are answered with 405.
  http::MethodBmp methods{static_cast<http::MethodBmp>(http::Method::GET)};

  // Names of the request headers to retain (case-insensitive). Others are read and dropped.
  // Content-Length is always interpreted for body framing, whether retained or not.
  std::vector<std::string> saveHeaders;

  // Maximum accepted request body size in bytes. Larger declared bodies are rejected with 413 before being read.
  std::size_t maxBodySize{1024};

  // When false, no header is retained at all, regardless of saveHeaders.
  bool parseHeaders{true};

  // Values of the Access-Control-Allow-Headers / Access-Control-Allow-Origin response headers.
  std::string allowedAccessControlHeaders{"*"};
  std::string allowedAccessControlOrigins{"*"};

  RouteConfig& withMethods(http::MethodBmp methodBmp);

  RouteConfig& withMethod(http::Method method) { return withMethods(static_cast<http::MethodBmp>(method)); }

  RouteConfig& withSaveHeaders(std::initializer_list<std::string_view> headerNames);

  // Appends one header name to retain, if not already present.
  RouteConfig& addSaveHeader(std::string_view headerName);

  RouteConfig& withMaxBodySize(std::size_t maxBodySize);

  RouteConfig& withParseHeaders(bool on = true);

  RouteConfig& withAllowedAccessControlHeaders(std::string_view value);

  RouteConfig& withAllowedAccessControlOrigins(std::string_view value);

  // Tells whether a request header with this name should be retained.
  [[nodiscard]] bool isHeaderSaved(std::string_view headerName) const noexcept;

  // Throws std::invalid_argument if the config is not valid.
  void validate() const;
};

}  // namespace tinyweb
