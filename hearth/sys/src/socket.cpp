#include "hearth/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include "hearth/errno-throw.hpp"
#include "hearth/log.hpp"

namespace hearth {

namespace {

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

void SetSocketOptionOrThrow(int fd, int option, const char* optionName) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, option, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt({}) failed for fd # {}", optionName, fd);
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ComputeSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(bool reusePort, uint16_t port) const {
  const int fd = _baseFd.fd();
  SetSocketOptionOrThrow(fd, SO_REUSEADDR, "SO_REUSEADDR");
  if (reusePort) {
    SetSocketOptionOrThrow(fd, SO_REUSEPORT, "SO_REUSEPORT");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    log::debug("bind failed for fd # {} on port {}: {}", fd, port, std::strerror(errno));
    return false;
  }
  return true;
}

void Socket::bindAndListen(bool reusePort, uint16_t& port) {
  const int fd = _baseFd.fd();
  if (!tryBind(reusePort, port)) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd, SOMAXCONN) == -1) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      throw_errno("getsockname failed for fd # {}", fd);
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd, port);
}

}  // namespace hearth
