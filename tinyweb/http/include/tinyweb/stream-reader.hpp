#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "tinyweb/task.hpp"
#include "tinyweb/transport.hpp"

namespace tinyweb {

// Bounded line reader over a Transport.
// The buffer has a fixed capacity: it never grows, whatever the client sends.
class StreamReader {
 public:
  StreamReader(ITransport& transport, std::size_t capacity);

  // Reads the next line, terminated by LF or CRLF. The terminator is not part of the returned line.
  // The returned view stays valid until the next read operation.
  // Returns std::nullopt if the line does not fit in the buffer, which is then left in an unspecified state.
  // Throws HttpError(IOError) if the peer closes the stream before the end of the line.
  Task<std::optional<std::string_view>> readLine();

  // Fills dst entirely, consuming already buffered bytes first.
  Task<void> readExact(std::span<char> dst);

  // Consumes and drops nbBytes bytes.
  Task<void> skip(std::size_t nbBytes);

  [[nodiscard]] std::size_t capacity() const noexcept { return _buf.size(); }

  [[nodiscard]] std::size_t nbBuffered() const noexcept { return _end - _beg; }

 private:
  // Reads more bytes at the end of the buffer. Throws HttpError(IOError) on end of stream.
  Task<void> fill();

  // Moves the pending bytes to the front of the buffer.
  void compact() noexcept;

  ITransport& _transport;
  std::vector<char> _buf;
  std::size_t _beg{0};
  std::size_t _end{0};
};

}  // namespace tinyweb
