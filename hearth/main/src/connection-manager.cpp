#include "hearth/connection-manager.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <utility>

#include "hearth/connection-state.hpp"
#include "hearth/connection.hpp"
#include "hearth/event-loop.hpp"
#include "hearth/event.hpp"
#include "hearth/http-status-code.hpp"
#include "hearth/log.hpp"
#include "hearth/socket-ops.hpp"
#include "hearth/socket.hpp"
#include "hearth/static-response.hpp"
#include "hearth/timedef.hpp"
#include "hearth/vector.hpp"

namespace hearth {

namespace {
constexpr EventBmp kClientEvents = EventIn | EventRdHup | EventEt;
}  // namespace

std::size_t ConnectionManager::acceptAll(const Socket& listenSocket) {
  std::size_t nbAccepted = 0;
  while (true) {
    Connection cnx(listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    if (_pConfig->tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      const auto err = errno;
      log::error("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", cnxFd, err, std::strerror(err));
    }
    if (!SetKeepAlive(cnxFd, _pConfig->keepAliveTimeout)) {
      const auto err = errno;
      log::error("setsockopt(SO_KEEPALIVE) failed for fd # {} err={} ({})", cnxFd, err, std::strerror(err));
    }
    if (!_pEventLoop->add(EventLoop::EventFd{cnxFd, kClientEvents})) {
      // Already logged, connection is closed when going out of scope
      continue;
    }
    auto pState = std::make_unique<ConnectionState>(std::move(cnx));
    pState->lastActivity = SteadyClock::now();
    _connections.emplace(cnxFd, std::move(pState));
    ++nbAccepted;
    log::trace("Accepted connection fd # {}", cnxFd);
  }
  return nbAccepted;
}

ConnectionState* ConnectionManager::find(int fd) {
  auto it = _connections.find(fd);
  return it == _connections.end() ? nullptr : it->second.get();
}

void ConnectionManager::close(int fd) {
  auto it = _connections.find(fd);
  if (it == _connections.end()) {
    log::error("Internal error: closing unknown connection fd # {}", fd);
    return;
  }
  _pEventLoop->del(fd);
  _connections.erase(it);
  log::trace("Closed connection fd # {}", fd);
}

ConnectionManager::ReadStatus ConnectionManager::read(ConnectionState& state, std::size_t maxBufferedBytes) {
  const int fd = state.connection.fd();
  while (state.inBuffer.size() < maxBufferedBytes) {
    int64_t nbRead = 0;
    int err = 0;
    const auto oldSize = state.inBuffer.size();
    state.inBuffer.resize_and_overwrite(oldSize + kReadChunkBytes, [&](char* data, std::size_t) {
      nbRead = Recv(fd, data + oldSize, kReadChunkBytes);
      err = errno;
      return nbRead > 0 ? oldSize + static_cast<std::size_t>(nbRead) : oldSize;
    });
    if (nbRead > 0) {
      state.lastActivity = SteadyClock::now();
      if (static_cast<std::size_t>(nbRead) < kReadChunkBytes) {
        // Socket receive buffer drained. With edge triggered notifications, new data will raise a new event.
        return ReadStatus::Drained;
      }
      continue;
    }
    if (nbRead == 0) {
      state.peerClosed = true;
      return ReadStatus::Drained;
    }
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return ReadStatus::Drained;
    }
    log::debug("recv failed for fd # {} err={} ({})", fd, err, std::strerror(err));
    return ReadStatus::Error;
  }
  return ReadStatus::BudgetReached;
}

bool ConnectionManager::setWritableInterest(ConnectionState& state, bool enable) {
  const EventBmp events = enable ? (kClientEvents | EventOut) : kClientEvents;
  if (!_pEventLoop->mod(EventLoop::EventFd{state.connection.fd(), events})) {
    return false;
  }
  state.waitingWritable = enable;
  return true;
}

bool ConnectionManager::flush(ConnectionState& state) {
  const int fd = state.connection.fd();
  std::size_t offset = 0;
  while (offset < state.outBuffer.size()) {
    const auto nbSent = SafeSend(fd, state.outBuffer.data() + offset, state.outBuffer.size() - offset);
    if (nbSent > 0) {
      offset += static_cast<std::size_t>(nbSent);
      state.lastActivity = SteadyClock::now();
      continue;
    }
    const auto err = errno;
    if (nbSent < 0 && err == EINTR) {
      continue;
    }
    if (nbSent < 0 && (err == EAGAIN || err == EWOULDBLOCK)) {
      state.outBuffer.erase(0, offset);
      return state.waitingWritable || setWritableInterest(state, true);
    }
    log::debug("send failed for fd # {} err={} ({})", fd, err, std::strerror(err));
    return false;
  }
  state.outBuffer.clear();
  if (state.waitingWritable && !setWritableInterest(state, false)) {
    return false;
  }
  if (state.closeAfterFlush || state.peerClosed) {
    return false;
  }
  if (state.drainAfterFlush && !state.halfClosed && state.isIdle()) {
    if (!ShutdownWrite(fd)) {
      return false;
    }
    state.halfClosed = true;
  }
  return true;
}

void ConnectionManager::sweep(SteadyTimePoint now) {
  vector<int> toClose;
  for (auto& [fd, pState] : _connections) {
    ConnectionState& state = *pState;
    if (state.hasRequestInProgress()) {
      if (_pConfig->requestTimeout.count() > 0 && now > state.requestStart + _pConfig->requestTimeout) {
        log::debug("Request timeout for fd # {}", fd);
        state.inBuffer.clear();
        state.bodyReader.reset();
        state.phase = ConnectionState::Phase::Head;
        state.requestStart = {};
        state.closeAfterFlush = true;
        state.outBuffer.append(BuildStaticResponse(http::StatusCodeRequestTimeout,
                                                   http::ReasonPhraseFor(http::StatusCodeRequestTimeout), false));
        if (!flush(state)) {
          toClose.push_back(fd);
        }
      }
    } else if (now > state.lastActivity + _pConfig->keepAliveTimeout) {
      toClose.push_back(fd);
    }
  }
  for (int fd : toClose) {
    close(fd);
  }
}

void ConnectionManager::beginDrain() {
  vector<int> toClose;
  for (auto& [fd, pState] : _connections) {
    ConnectionState& state = *pState;
    if (state.halfClosed) {
      continue;
    }
    if (state.isIdle() && !state.hasRequestInProgress()) {
      if (ShutdownWrite(fd)) {
        state.halfClosed = true;
      } else {
        toClose.push_back(fd);
      }
    } else {
      state.drainAfterFlush = true;
    }
  }
  for (int fd : toClose) {
    close(fd);
  }
}

void ConnectionManager::closeAll() {
  if (!_connections.empty()) {
    log::debug("Closing {} connection(s)", _connections.size());
  }
  for (const auto& [fd, pState] : _connections) {
    _pEventLoop->del(fd);
  }
  _connections.clear();
}

}  // namespace hearth
