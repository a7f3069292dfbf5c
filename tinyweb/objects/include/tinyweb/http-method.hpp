#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace tinyweb::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

using MethodBmp = uint16_t;

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(static_cast<MethodIdx>(lhs) | static_cast<MethodIdx>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodIdx>(rhs));
}

static_assert(kNbMethods <= sizeof(MethodBmp) * 8, "MethodBmp type too small to hold all methods");

// Check if a method is allowed by mask.
constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Case-sensitive method token lookup. Returns std::nullopt for unsupported methods.
constexpr std::optional<Method> MethodFromStr(std::string_view methodStr) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == methodStr) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

// Whether a request with this method may carry a body the server should read.
constexpr bool IsBodyBearing(Method method) {
  return method == Method::POST || method == Method::PUT || method == Method::PATCH || method == Method::DELETE;
}

// Joins the methods set in mask in their canonical order, e.g. "GET, POST".
inline std::string MethodBmpToStr(MethodBmp mask, std::string_view sep = ", ") {
  std::string ret;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (IsMethodSet(mask, MethodFromIdx(methodIdx))) {
      if (!ret.empty()) {
        ret.append(sep);
      }
      ret.append(kMethodStrings[methodIdx]);
    }
  }
  return ret;
}

}  // namespace tinyweb::http
