#include "hearth/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace hearth {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

bool SetKeepAlive(int fd, std::chrono::milliseconds idle) noexcept {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &kEnable, sizeof(kEnable)) != 0) {
    return false;
  }
  const auto idleSeconds =
      static_cast<int>(std::max<std::chrono::seconds::rep>(1, std::chrono::ceil<std::chrono::seconds>(idle).count()));
  return ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idleSeconds, sizeof(idleSeconds)) == 0;
}

int GetSocketError(int fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return errno;
  }
  return err;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t Recv(int fd, void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::recv(fd, data, len, 0));
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }


}  // namespace hearth
