#include "tinyweb/request-parser.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-error.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/router.hpp"
#include "tinyweb/string-equal-ignore-case.hpp"
#include "tinyweb/string-trim.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

namespace {

constexpr std::size_t kNbRequestLineTokens = 3;

// Splits the request line on spaces and tabs. Returns false if it does not hold exactly 3 tokens.
bool SplitRequestLine(std::string_view line, std::array<std::string_view, kNbRequestLineTokens>& tokens) {
  std::size_t nbTokens = 0;
  while (true) {
    const auto tokenBeg = line.find_first_not_of(kOws);
    if (tokenBeg == std::string_view::npos) {
      break;
    }
    if (nbTokens == kNbRequestLineTokens) {
      return false;
    }
    line.remove_prefix(tokenBeg);
    const auto tokenEnd = line.find_first_of(kOws);
    tokens[nbTokens++] = line.substr(0, tokenEnd);
    if (tokenEnd == std::string_view::npos) {
      break;
    }
    line.remove_prefix(tokenEnd);
  }
  return nbTokens == kNbRequestLineTokens;
}

std::size_t ParseContentLength(std::string_view value) {
  std::size_t contentLength{};
  const char* last = value.data() + value.size();
  const auto [ptr, errc] = std::from_chars(value.data(), last, contentLength);
  if (value.empty() || errc != std::errc{} || ptr != last) {
    throw HttpError(ErrorKind::BadRequest, "Invalid Content-Length");
  }
  return contentLength;
}

}  // namespace

Task<ParsedRequest> RequestParser::parse() {
  try {
    co_return co_await parseRequest();
  } catch (...) {
    _state = State::Failed;
    throw;
  }
}

Task<ParsedRequest> RequestParser::parseRequest() {
  _state = State::StatusLine;
  std::optional<std::string_view> line;
  do {
    line = co_await _reader.readLine();
    if (!line) {
      throw HttpError(ErrorKind::BadRequest, "Request line too long");
    }
  } while (line->empty());

  std::array<std::string_view, kNbRequestLineTokens> tokens;
  if (!SplitRequestLine(*line, tokens)) {
    throw HttpError(ErrorKind::BadRequest, "Malformed request line");
  }
  const auto method = http::MethodFromStr(tokens[0]);
  if (!method) {
    throw HttpError(ErrorKind::BadRequest, "Unsupported method");
  }

  ParsedRequest parsed;
  HttpRequest& request = parsed.request;
  request.setMethod(*method);
  const std::string_view target = tokens[1];
  const auto queryPos = target.find('?');
  request.setPath(target.substr(0, queryPos));
  if (queryPos != std::string_view::npos) {
    request.setQueryString(target.substr(queryPos + 1));
  }
  request.setVersion(tokens[2]);

  RouteMatch routeMatch = _router.match(*method, request.path());
  switch (routeMatch.status) {
    case RouteMatch::Status::NotFound:
      co_await drainHeaders();
      throw HttpError(ErrorKind::NotFound, fmt::format("No route for {}", request.path()));
    case RouteMatch::Status::MethodNotAllowed:
      co_await drainHeaders();
      throw HttpError(ErrorKind::MethodNotAllowed,
                      fmt::format("{} is not allowed on {}", http::MethodToStr(*method), request.path()));
    case RouteMatch::Status::Preflight:
      parsed.preflight = true;
      break;
    default:
      break;
  }
  const RouteConfig& config = routeMatch.route->config;

  _state = State::Headers;
  std::size_t contentLength = 0;
  while (true) {
    line = co_await _reader.readLine();
    if (!line) {
      throw HttpError(ErrorKind::HeaderTooLarge, "Header line too long");
    }
    if (line->empty()) {
      break;
    }
    const auto colonPos = line->find(':');
    if (colonPos == 0 || colonPos == std::string_view::npos) {
      throw HttpError(ErrorKind::BadRequest, "Malformed header line");
    }
    const std::string_view name = line->substr(0, colonPos);
    if (name.find_first_of(kOws) != std::string_view::npos) {
      throw HttpError(ErrorKind::BadRequest, "Malformed header name");
    }
    const std::string_view value = TrimOws(line->substr(colonPos + 1));
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      contentLength = ParseContentLength(value);
    }
    if (config.parseHeaders && config.isHeaderSaved(name)) {
      request.addHeader(name, value);
    }
  }
  request.setContentLength(contentLength);

  if (contentLength != 0) {
    if (contentLength > config.maxBodySize) {
      throw HttpError(ErrorKind::PayloadTooLarge,
                      fmt::format("Body of {} bytes exceeds the limit of {} bytes", contentLength, config.maxBodySize));
    }
    _state = State::Body;
    if (http::IsBodyBearing(*method)) {
      std::string body(contentLength, '\0');
      co_await _reader.readExact(std::span<char>(body.data(), body.size()));
      request.setBody(std::move(body));
    } else {
      co_await _reader.skip(contentLength);
    }
  }

  request.setPathParams(std::move(routeMatch.pathParams));
  parsed.route = routeMatch.route;
  _state = State::Complete;
  log::debug("Parsed {} {}", http::MethodToStr(*method), request.path());
  co_return std::move(parsed);
}

Task<void> RequestParser::drainHeaders() {
  _state = State::Headers;
  while (true) {
    const auto line = co_await _reader.readLine();
    if (!line) {
      throw HttpError(ErrorKind::HeaderTooLarge, "Header line too long");
    }
    if (line->empty()) {
      break;
    }
  }
}

}  // namespace tinyweb
