#pragma once

#include <string_view>

#include "tinyweb/http-status-code.hpp"

namespace tinyweb::http {

// Header field names are case-insensitive. They are stored here in their canonical form for emission.

// Version
inline constexpr std::string_view HTTP10 = "1.0";
inline constexpr std::string_view HTTP11 = "1.1";

// Standard Header Field Names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view AccessControlAllowOrigin = "Access-Control-Allow-Origin";
inline constexpr std::string_view AccessControlAllowMethods = "Access-Control-Allow-Methods";
inline constexpr std::string_view AccessControlAllowHeaders = "Access-Control-Allow-Headers";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

// Common Header Values
inline constexpr std::string_view close = "close";
inline constexpr std::string_view NoCache = "no-cache";

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";

// Return the canonical reason phrase of a status code, or an empty string for unknown ones.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodePartialContent:
      return "Partial Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeSeeOther:
      return "See Other";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeNotAcceptable:
      return "Not Acceptable";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeConflict:
      return "Conflict";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    default:
      return "";
  }
}

}  // namespace tinyweb::http
