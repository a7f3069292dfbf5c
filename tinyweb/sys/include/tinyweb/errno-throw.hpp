#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

namespace tinyweb {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for port {}", port);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace tinyweb
