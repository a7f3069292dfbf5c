#include "tinyweb/url-decode.hpp"

#include <string>
#include <string_view>

namespace tinyweb {

namespace {

constexpr int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string UrlDecode(std::string_view encoded, bool plusAsSpace) {
  std::string out;
  out.reserve(encoded.size());
  for (std::string_view::size_type pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch == '%' && pos + 2 < encoded.size()) {
      const int hi = HexValue(encoded[pos + 1]);
      const int lo = HexValue(encoded[pos + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        pos += 2;
        continue;
      }
    }
    if (ch == '+' && plusAsSpace) {
      out.push_back(' ');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

QueryParams ParseQueryString(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    query = ampPos == std::string_view::npos ? std::string_view{} : query.substr(ampPos + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eqPos = pair.find('=');
    if (eqPos == std::string_view::npos) {
      params.emplace_back(UrlDecode(pair), std::string{});
    } else {
      params.emplace_back(UrlDecode(pair.substr(0, eqPos)), UrlDecode(pair.substr(eqPos + 1)));
    }
  }
  return params;
}

}  // namespace tinyweb
