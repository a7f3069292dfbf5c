#pragma once

#include <cstdint>

#include "tinyweb/http-request.hpp"
#include "tinyweb/router.hpp"
#include "tinyweb/stream-reader.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

struct ParsedRequest {
  HttpRequest request;
  const Route* route{nullptr};
  // OPTIONS request on a route that does not serve OPTIONS itself.
  bool preflight{false};
};

// Incremental parser of one request, reading from a bounded StreamReader.
// The route is resolved right after the request line so that only the headers it retains are stored.
// Failures are thrown as HttpError: BadRequest, HeaderTooLarge, PayloadTooLarge, NotFound, MethodNotAllowed or IOError.
class RequestParser {
 public:
  enum class State : uint8_t { StatusLine, Headers, Body, Complete, Failed };

  RequestParser(StreamReader& reader, const Router& router) noexcept : _reader(reader), _router(router) {}

  // Reads the next request. Every read may suspend the calling task.
  Task<ParsedRequest> parse();

  [[nodiscard]] State state() const noexcept { return _state; }

 private:
  Task<ParsedRequest> parseRequest();

  // Consumes the remaining header lines of a request that will not be served.
  Task<void> drainHeaders();

  StreamReader& _reader;
  const Router& _router;
  State _state{State::StatusLine};
};

}  // namespace tinyweb
