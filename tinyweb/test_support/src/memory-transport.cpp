#include "tinyweb/memory-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "tinyweb/http-error.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb::test {

MemoryTransport::MemoryTransport(std::string input, std::size_t maxReadSize)
    : _input(std::move(input)), _maxReadSize(maxReadSize) {}

Task<std::size_t> MemoryTransport::read(std::span<char> buf) {
  const std::size_t nbRead = std::min({buf.size(), _maxReadSize, _input.size() - _readPos});
  std::memcpy(buf.data(), _input.data() + _readPos, nbRead);
  _readPos += nbRead;
  co_return nbRead;
}

Task<void> MemoryTransport::write(std::string_view data) {
  if (_failWrites) {
    throw HttpError(ErrorKind::IOError, "Simulated write failure");
  }
  _output.append(data);
  ++_nbWrites;
  co_return;
}

}  // namespace tinyweb::test
