#include "tinyweb/stream-reader.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>

#include "tinyweb/http-error.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/transport.hpp"

namespace tinyweb {

StreamReader::StreamReader(ITransport& transport, std::size_t capacity) : _transport(transport), _buf(capacity) {}

Task<std::optional<std::string_view>> StreamReader::readLine() {
  std::size_t scanPos = _beg;
  while (true) {
    const char* first = _buf.data();
    const void* lf = std::memchr(first + scanPos, '\n', _end - scanPos);
    if (lf != nullptr) {
      const auto lfPos = static_cast<std::size_t>(static_cast<const char*>(lf) - first);
      std::string_view line(first + _beg, lfPos - _beg);
      _beg = lfPos + 1;
      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }
      co_return line;
    }
    if (_end - _beg == _buf.size()) {
      co_return std::nullopt;
    }
    scanPos = _end - _beg;
    compact();
    co_await fill();
  }
}

Task<void> StreamReader::readExact(std::span<char> dst) {
  const std::size_t nbFromBuffer = std::min(dst.size(), nbBuffered());
  std::memcpy(dst.data(), _buf.data() + _beg, nbFromBuffer);
  _beg += nbFromBuffer;
  for (std::size_t pos = nbFromBuffer; pos < dst.size();) {
    const std::size_t nbRead = co_await _transport.read(dst.subspan(pos));
    if (nbRead == 0) {
      throw HttpError(ErrorKind::IOError, "Connection closed while reading body");
    }
    pos += nbRead;
  }
}

Task<void> StreamReader::skip(std::size_t nbBytes) {
  while (true) {
    const std::size_t nbFromBuffer = std::min(nbBytes, nbBuffered());
    _beg += nbFromBuffer;
    nbBytes -= nbFromBuffer;
    if (nbBytes == 0) {
      break;
    }
    compact();
    co_await fill();
  }
}

Task<void> StreamReader::fill() {
  const std::size_t nbRead = co_await _transport.read(std::span<char>(_buf.data() + _end, _buf.size() - _end));
  if (nbRead == 0) {
    throw HttpError(ErrorKind::IOError, "Connection closed by peer");
  }
  _end += nbRead;
}

void StreamReader::compact() noexcept {
  if (_beg != 0) {
    std::memmove(_buf.data(), _buf.data() + _beg, _end - _beg);
    _end -= _beg;
    _beg = 0;
  }
}

}  // namespace tinyweb
