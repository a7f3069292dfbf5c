#pragma once

#include <cstdint>

namespace tinyweb::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodePartialContent = 206;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeSeeOther = 303;
inline constexpr StatusCode StatusCodeNotModified = 304;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeNotAcceptable = 406;
inline constexpr StatusCode StatusCodeRequestTimeout = 408;
inline constexpr StatusCode StatusCodeConflict = 409;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

}  // namespace tinyweb::http
