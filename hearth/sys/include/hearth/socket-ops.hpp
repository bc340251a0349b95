#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hearth {

// Thin wrappers centralising socket system calls so that higher-level modules never include networking headers
// directly. All of them are non-throwing: they report failure through their return value, with errno set.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Enable SO_KEEPALIVE on a TCP socket, with the first probe sent after 'idle' of inactivity (rounded up to the second,
// at least 1 second). Returns true on success.
bool SetKeepAlive(int fd, std::chrono::milliseconds idle) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
int GetSocketError(int fd) noexcept;

// Send data on a connected socket without raising SIGPIPE (MSG_NOSIGNAL).
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Receive available data from a connected socket.
// Returns the number of bytes read, 0 on orderly shutdown by the peer, or -1 on error (errno is set).
int64_t Recv(int fd, void* data, std::size_t len) noexcept;

// Shutdown the write half of a socket connection (the peer reads EOF).
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

}  // namespace hearth
