#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "tinyweb/http-status-code.hpp"

namespace tinyweb {

// Failures of the request processing engine.
enum class ErrorKind : std::uint8_t {
  BadRequest,        // malformed request line or header
  HeaderTooLarge,    // header line longer than the line buffer
  PayloadTooLarge,   // declared body larger than the route limit
  NotFound,          // no route matches the path
  MethodNotAllowed,  // a route matches the path, not the method
  HandlerError,      // user handler failed
  InvalidState,      // response writer misuse (e.g. setting a header after start)
  Timeout,           // request not received within the request timeout
  IOError            // socket level failure or premature end of stream
};

std::string_view ErrorKindToStr(ErrorKind kind) noexcept;

// Status code answered for each kind of failure.
http::StatusCode StatusCodeFor(ErrorKind kind) noexcept;

class HttpError : public std::runtime_error {
 public:
  HttpError(ErrorKind kind, const char* what) : std::runtime_error(what), _kind(kind), _status(StatusCodeFor(kind)) {}

  HttpError(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), _kind(kind), _status(StatusCodeFor(kind)) {}

  // Error carrying an explicit status code, typically thrown by handlers (for instance 404 for a missing item).
  explicit HttpError(http::StatusCode status, const std::string& what = {})
      : std::runtime_error(what), _kind(ErrorKind::HandlerError), _status(status) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _status; }

 private:
  ErrorKind _kind;
  http::StatusCode _status;
};

}  // namespace tinyweb
