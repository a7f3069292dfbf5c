#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "tinyweb/task.hpp"

namespace tinyweb {

// Byte stream of one client connection.
// Operations suspend the calling task until they can progress. Failures are reported as HttpError(IOError).
class ITransport {
 public:
  virtual ~ITransport() = default;

  // Reads at least one byte into buf. Returns 0 when the peer closed its side.
  virtual Task<std::size_t> read(std::span<char> buf) = 0;

  // Writes all of data.
  virtual Task<void> write(std::string_view data) = 0;
};

}  // namespace tinyweb
