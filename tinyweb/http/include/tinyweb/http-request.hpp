#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tinyweb/http-method.hpp"
#include "tinyweb/path-params.hpp"
#include "tinyweb/url-decode.hpp"

namespace tinyweb {

// A parsed HTTP request, as handed to route handlers.
// Only the headers retained by the route configuration are available.
class HttpRequest {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Path without the query string, not URL-decoded.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string, without the '?'. Empty if absent.
  [[nodiscard]] std::string_view queryString() const noexcept { return _queryString; }

  // Version token as sent by the client, e.g. "HTTP/1.0".
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Declared Content-Length, 0 when absent.
  [[nodiscard]] std::size_t contentLength() const noexcept { return _contentLength; }

  // Case-insensitive lookup of a retained header. Returns the first occurrence.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;

  // Retained headers, in reception order.
  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view name) const noexcept {
    return _pathParams.get(name);
  }

  // Decoded query string parameters, in order.
  [[nodiscard]] QueryParams queryParams() const { return ParseQueryString(_queryString); }

  // Decoded value of the first query parameter with this name.
  [[nodiscard]] std::optional<std::string> queryParam(std::string_view name) const;

  void setMethod(http::Method method) noexcept { _method = method; }
  void setPath(std::string_view path) { _path = path; }
  void setQueryString(std::string_view queryString) { _queryString = queryString; }
  void setVersion(std::string_view version) { _version = version; }
  void setBody(std::string body) noexcept { _body = std::move(body); }
  void setContentLength(std::size_t contentLength) noexcept { _contentLength = contentLength; }
  void setPathParams(PathParams pathParams) noexcept { _pathParams = std::move(pathParams); }

  void addHeader(std::string_view name, std::string_view value) { _headers.emplace_back(name, value); }

 private:
  std::string _path;
  std::string _queryString;
  std::string _version;
  std::string _body;
  std::vector<HeaderField> _headers;
  PathParams _pathParams;
  std::size_t _contentLength{0};
  http::Method _method{http::Method::GET};
};

}  // namespace tinyweb
