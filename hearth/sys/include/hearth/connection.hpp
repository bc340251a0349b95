#pragma once

#include "hearth/base-fd.hpp"

namespace hearth {

class Socket;

// An accepted client connection (non-blocking, close-on-exec).
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts the next pending connection of given listening socket.
  // The resulting Connection is empty (evaluates to false) if there are no more pending connections or on error
  // (logged).
  explicit Connection(const Socket& socket);

  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

  bool operator==(const Connection&) const noexcept = default;

 private:
  BaseFd _baseFd;
};

}  // namespace hearth
