#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tinyweb {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Decodes %XX escapes. When plusAsSpace is true, '+' is decoded as a space (form encoding).
// Malformed escapes are kept verbatim.
std::string UrlDecode(std::string_view encoded, bool plusAsSpace = true);

// Parses 'a=1&b=two' into ordered (name, value) pairs, decoding both sides.
// A pair without '=' gets an empty value. Empty pairs are skipped.
QueryParams ParseQueryString(std::string_view query);

}  // namespace tinyweb
