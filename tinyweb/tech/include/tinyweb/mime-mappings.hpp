#pragma once

#include <string_view>

namespace tinyweb {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

// Sorted by extension for binary search.
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"bmp", "image/bmp"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"mjs", "application/javascript"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
};

inline constexpr std::string_view kDefaultMIMEType = "text/plain";

// Returns the MIME type associated to the extension of given path, or kDefaultMIMEType if unknown.
// Extension lookup is case-sensitive.
std::string_view MIMETypeForPath(std::string_view path) noexcept;

}  // namespace tinyweb
