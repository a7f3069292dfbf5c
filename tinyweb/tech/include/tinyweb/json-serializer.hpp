#pragma once

#include <expected>
#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace tinyweb {

/// Serialize a C++ object to a JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize (glz::json_t included).
/// Returns the error description on failure.
template <typename T>
[[nodiscard]] std::expected<std::string, std::string> SerializeToJson(const T& obj) {
  auto result = glz::write_json(obj);
  if (!result) {
    return std::unexpected(std::string("JSON serialization error code ") +
                           std::to_string(static_cast<int>(result.error().ec)));
  }
  return std::move(*result);
}

/// Parse a JSON document into a generic glz::json_t value.
[[nodiscard]] inline std::expected<glz::json_t, std::string> ParseJson(const std::string& text) {
  glz::json_t value;
  const auto ec = glz::read_json(value, text);
  if (ec) {
    return std::unexpected(glz::format_error(ec, text));
  }
  return value;
}

}  // namespace tinyweb
