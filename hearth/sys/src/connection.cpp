#include "hearth/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "hearth/base-fd.hpp"
#include "hearth/log.hpp"
#include "hearth/socket.hpp"

namespace hearth {

namespace {
int ComputeConnectionFd(int socketFd) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("Connection accept would block: {} - this is expected if no pending connections",
                 std::strerror(savedErr));
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(savedErr));
    }
    fd = BaseFd::kClosedFd;
  } else {
    log::debug("Connection fd # {} opened", fd);
  }
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(ComputeConnectionFd(socket.fd())) {}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

}  // namespace hearth
