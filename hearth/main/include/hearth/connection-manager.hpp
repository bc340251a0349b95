#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "hearth/connection-state.hpp"
#include "hearth/event-loop.hpp"
#include "hearth/flat-hash-map.hpp"
#include "hearth/http-server-config.hpp"
#include "hearth/socket.hpp"
#include "hearth/timedef.hpp"

namespace hearth {

// Owns the set of active client connections of a server.
//
// Every accepted connection is tuned (TCP_NODELAY, SO_KEEPALIVE), registered in the event loop (edge triggered)
// and stored in the active set until it is closed. Not thread-safe: only used from the event loop thread.
class ConnectionManager {
 public:
  // Size of the chunks read from client sockets.
  static constexpr std::size_t kReadChunkBytes = 4096;

  ConnectionManager(EventLoop& eventLoop, const HttpServerConfig& config) noexcept
      : _pEventLoop(&eventLoop), _pConfig(&config) {}

  // Accepts all pending connections of the listening socket. Returns the number of accepted connections.
  std::size_t acceptAll(const Socket& listenSocket);

  // Returns the state of the connection with given fd, or nullptr if not found.
  [[nodiscard]] ConnectionState* find(int fd);

  // Deregisters the connection from the event loop, removes it from the active set and closes it.
  void close(int fd);

  enum class ReadStatus : uint8_t {
    // No more bytes to read for now (or the peer closed its side, see ConnectionState::peerClosed).
    Drained,
    // Stopped reading because the input buffer reached the given budget. More bytes may be available.
    BudgetReached,
    // Transport error, the connection should be closed.
    Error
  };

  // Reads available bytes from the connection into its input buffer, until there are none left or the input buffer
  // holds at least maxBufferedBytes.
  [[nodiscard]] ReadStatus read(ConnectionState& state, std::size_t maxBufferedBytes);

  // Sends as much of the output buffer as possible, subscribing to writability when the socket is full.
  // Once fully sent, applies the pending close or half close.
  // Returns false if the connection should be closed now.
  [[nodiscard]] bool flush(ConnectionState& state);

  // Closes connections that are idle since more than the keep-alive timeout and answers 408 to requests that were not
  // fully received within the request timeout.
  void sweep(SteadyTimePoint now);

  // Half closes idle connections and marks the busy ones to be half closed once their current response is sent.
  void beginDrain();

  // Closes all connections immediately.
  void closeAll();

  [[nodiscard]] std::size_t size() const noexcept { return _connections.size(); }

  [[nodiscard]] bool empty() const noexcept { return _connections.empty(); }

 private:
  bool setWritableInterest(ConnectionState& state, bool enable);

  EventLoop* _pEventLoop;
  const HttpServerConfig* _pConfig;
  // Values are allocated separately so that references to states stay valid when the map grows.
  flat_hash_map<int, std::unique_ptr<ConnectionState>> _connections;
};

}  // namespace hearth
