#include "tinyweb/http-response.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tinyweb/file.hpp"
#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-error.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/string-equal-ignore-case.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

namespace {
const RouteConfig kDefaultRouteConfig;
}  // namespace

std::string_view StateToStr(HttpResponse::State state) noexcept {
  switch (state) {
    case HttpResponse::State::NotStarted:
      return "NotStarted";
    case HttpResponse::State::HeadersSent:
      return "HeadersSent";
    case HttpResponse::State::BodyStreaming:
      return "BodyStreaming";
    case HttpResponse::State::Done:
      return "Done";
    default:
      return "Unknown";
  }
}

void HttpResponse::ensureNotStarted(std::string_view operation) const {
  if (_state != State::NotStarted) {
    throw HttpError(ErrorKind::InvalidState,
                    fmt::format("Cannot {} in response state {}", operation, StateToStr(_state)));
  }
}

HttpResponse& HttpResponse::setStatus(http::StatusCode status) {
  ensureNotStarted("set status");
  _status = status;
  return *this;
}

HttpResponse& HttpResponse::setVersion(std::string_view version) {
  ensureNotStarted("set version");
  _version = version;
  return *this;
}

HttpResponse& HttpResponse::setHeader(std::string_view name, std::string_view value) {
  ensureNotStarted("set header");
  auto it = std::ranges::find_if(_headers, [name](const HeaderField& field) {
    return CaseInsensitiveEqual(field.first, name);
  });
  if (it == _headers.end()) {
    _headers.emplace_back(name, value);
  } else {
    it->second = value;
  }
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) {
  ensureNotStarted("add header");
  _headers.emplace_back(name, value);
  return *this;
}

HttpResponse& HttpResponse::addAccessControlHeaders() {
  const RouteConfig& routeConfig = _routeConfig == nullptr ? kDefaultRouteConfig : *_routeConfig;
  setHeader(http::AccessControlAllowOrigin, routeConfig.allowedAccessControlOrigins);
  setHeader(http::AccessControlAllowMethods, http::MethodBmpToStr(routeConfig.methods));
  setHeader(http::AccessControlAllowHeaders, routeConfig.allowedAccessControlHeaders);
  return *this;
}

std::optional<std::string_view> HttpResponse::header(std::string_view name) const noexcept {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

Task<void> HttpResponse::write(std::string_view data) {
  try {
    co_await _transport.write(data);
  } catch (...) {
    // nothing more can be emitted on a failed stream
    _state = State::Done;
    throw;
  }
}

Task<void> HttpResponse::start(std::string_view contentType) {
  ensureNotStarted("start");
  if (!contentType.empty() && !header(http::ContentType)) {
    _headers.emplace_back(http::ContentType, contentType);
  }

  std::string head = fmt::format("HTTP/{} {} {}{}", _version, _status, http::ReasonPhraseFor(_status), http::CRLF);
  for (const auto& [name, value] : _headers) {
    head.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  head.append(http::CRLF);

  _state = State::HeadersSent;
  co_await write(head);
}

Task<void> HttpResponse::send(std::string_view data) {
  if (_state == State::Done) {
    throw HttpError(ErrorKind::InvalidState, "Cannot send body data on a completed response");
  }
  if (_state == State::NotStarted) {
    co_await start();
  }
  _state = State::BodyStreaming;
  if (!data.empty()) {
    co_await write(data);
  }
}

Task<void> HttpResponse::sendFile(std::string_view path, SendFileOptions options) {
  ensureNotStarted("send file");
  File file(path);
  if (!file) {
    log::debug("File '{}' not found", path);
    co_await error(http::StatusCodeNotFound);
    co_return;
  }

  const std::size_t fileSize = file.size();
  setHeader(http::ContentLength, std::to_string(fileSize));
  if (!options.contentEncoding.empty()) {
    setHeader(http::ContentEncoding, options.contentEncoding);
  }
  if (options.maxAge.count() == 0) {
    setHeader(http::CacheControl, http::NoCache);
  } else {
    setHeader(http::CacheControl, fmt::format("max-age={}", options.maxAge.count()));
  }
  co_await start(options.contentType.empty() ? file.detectedContentType() : options.contentType);
  _state = State::BodyStreaming;

  std::vector<char> chunk(std::min(_options.sendFileChunkSize, fileSize));
  for (std::size_t offset = 0; offset < fileSize;) {
    const std::size_t nbToRead = std::min(chunk.size(), fileSize - offset);
    const std::size_t nbRead = file.readAt(std::span<char>(chunk.data(), nbToRead), offset);
    if (nbRead == File::kError || nbRead == 0) {
      _state = State::Done;
      throw HttpError(ErrorKind::IOError, fmt::format("Failed to read '{}' at offset {}", path, offset));
    }
    co_await write(std::string_view(chunk.data(), nbRead));
    offset += nbRead;
  }
  markDone();
}

Task<void> HttpResponse::redirect(std::string_view location) {
  ensureNotStarted("redirect");
  _status = http::StatusCodeFound;
  setHeader(http::Location, location);
  setHeader(http::ContentLength, "0");
  co_await start({});
  markDone();
}

Task<void> HttpResponse::error(http::StatusCode status, std::string_view diagnostics) {
  ensureNotStarted("emit an error");
  _status = status;
  std::string body = fmt::format("HTTP {} {}{}", status, http::ReasonPhraseFor(status), http::CRLF);
  if (_options.debug && !diagnostics.empty()) {
    body.append(diagnostics).append(http::CRLF);
  }
  setHeader(http::ContentType, http::ContentTypeTextPlain);
  setHeader(http::ContentLength, std::to_string(body.size()));
  co_await start(http::ContentTypeTextPlain);
  _state = State::BodyStreaming;
  co_await write(body);
  markDone();
}

}  // namespace tinyweb
