#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "tinyweb/task.hpp"
#include "tinyweb/transport.hpp"

namespace tinyweb::test {

// Transport over in-memory buffers. Its operations never suspend, so Tasks using it can be run synchronously.
class MemoryTransport : public ITransport {
 public:
  // input is delivered by reads of at most maxReadSize bytes, then reads return 0 (end of stream).
  explicit MemoryTransport(std::string input = {}, std::size_t maxReadSize = std::numeric_limits<std::size_t>::max());

  Task<std::size_t> read(std::span<char> buf) override;

  // Appends data to output(), or throws HttpError(IOError) when write failures are simulated.
  Task<void> write(std::string_view data) override;

  [[nodiscard]] const std::string& output() const noexcept { return _output; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  [[nodiscard]] std::size_t nbBytesRead() const noexcept { return _readPos; }

  void failWrites(bool on = true) noexcept { _failWrites = on; }

 private:
  std::string _input;
  std::string _output;
  std::size_t _maxReadSize;
  std::size_t _readPos{0};
  std::size_t _nbWrites{0};
  bool _failWrites{false};
};

}  // namespace tinyweb::test
