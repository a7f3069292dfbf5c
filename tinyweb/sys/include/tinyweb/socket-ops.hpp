#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tinyweb {

// Thin wrappers centralising socket system calls so that higher-level modules
// never include networking headers directly.

// Enable TCP_NODELAY (disable Nagle's algorithm). Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Retrieve the local port bound to fd, or 0 on failure.
uint16_t GetLocalPort(int fd) noexcept;

// Non-blocking send with MSG_NOSIGNAL.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, std::string_view data) noexcept;

// Receive up to len bytes. Returns bytes read, 0 on orderly shutdown, -1 on error (errno is set).
int64_t SafeRecv(int fd, char* buf, std::size_t len) noexcept;

// Shutdown the write half of a socket connection. Returns false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

}  // namespace tinyweb
