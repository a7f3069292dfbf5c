#pragma once

#include <string_view>

namespace tinyweb {

constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch = static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace tinyweb
