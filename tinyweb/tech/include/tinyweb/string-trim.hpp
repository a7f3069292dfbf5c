#pragma once

#include <string_view>

namespace tinyweb {

// Optional white space as defined by RFC 7230: spaces and horizontal tabs.
inline constexpr std::string_view kOws = " \t";

constexpr std::string_view TrimOws(std::string_view sv) {
  const auto first = sv.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(kOws);
  return sv.substr(first, last - first + 1);
}

}  // namespace tinyweb
