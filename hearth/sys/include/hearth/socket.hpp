#pragma once

#include <cstdint>

#include "hearth/base-fd.hpp"

namespace hearth {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type.
  // Throws std::invalid_argument for an unknown type, std::system_error on socket creation failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Try to bind the socket on all interfaces to the given port with specified options.
  // Returns true on success, false if bind itself failed (address in use...).
  // Throws std::system_error on setsockopt failure.
  [[nodiscard]] bool tryBind(bool reusePort, uint16_t port) const;

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and written back into the
  // argument. Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace hearth
