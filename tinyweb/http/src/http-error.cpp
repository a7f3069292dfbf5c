#include "tinyweb/http-error.hpp"

#include <string_view>

#include "tinyweb/http-status-code.hpp"

namespace tinyweb {

std::string_view ErrorKindToStr(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::BadRequest:
      return "BadRequest";
    case ErrorKind::HeaderTooLarge:
      return "HeaderTooLarge";
    case ErrorKind::PayloadTooLarge:
      return "PayloadTooLarge";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::MethodNotAllowed:
      return "MethodNotAllowed";
    case ErrorKind::HandlerError:
      return "HandlerError";
    case ErrorKind::InvalidState:
      return "InvalidState";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::IOError:
      return "IOError";
    default:
      return "Unknown";
  }
}

http::StatusCode StatusCodeFor(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::BadRequest:
      return http::StatusCodeBadRequest;
    case ErrorKind::HeaderTooLarge:
      return http::StatusCodeRequestHeaderFieldsTooLarge;
    case ErrorKind::PayloadTooLarge:
      return http::StatusCodePayloadTooLarge;
    case ErrorKind::NotFound:
      return http::StatusCodeNotFound;
    case ErrorKind::MethodNotAllowed:
      return http::StatusCodeMethodNotAllowed;
    case ErrorKind::Timeout:
      return http::StatusCodeRequestTimeout;
    default:
      return http::StatusCodeInternalServerError;
  }
}

}  // namespace tinyweb
