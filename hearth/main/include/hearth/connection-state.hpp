#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "hearth/body-reader.hpp"
#include "hearth/connection.hpp"
#include "hearth/http-request.hpp"
#include "hearth/router.hpp"
#include "hearth/timedef.hpp"

namespace hearth {

// Per connection state, owned by the ConnectionManager from accept to close.
struct ConnectionState {
  enum class Phase : uint8_t { Head, Body };

  explicit ConnectionState(Connection cnx) noexcept : connection(std::move(cnx)) {}

  // A connection is idle between two requests: nothing received for the next request, nothing left to send.
  [[nodiscard]] bool isIdle() const noexcept {
    return phase == Phase::Head && inBuffer.empty() && outBuffer.empty();
  }

  [[nodiscard]] bool hasRequestInProgress() const noexcept {
    return requestStart.time_since_epoch().count() != 0;
  }

  Connection connection;
  std::string inBuffer;
  std::string outBuffer;
  HttpRequest request;
  BodyReader bodyReader;
  // Handler resolved for the request whose body is being read, nullptr for 404.
  const Router::Handler* pHandler{nullptr};
  SteadyTimePoint lastActivity;
  // Time of the first byte of the request being received, zero when no request is in progress.
  SteadyTimePoint requestStart;
  Phase phase{Phase::Head};
  // Close the connection once outBuffer has been fully sent.
  bool closeAfterFlush{false};
  // Half close (shut down the write side) the connection once the current response has been sent.
  bool drainAfterFlush{false};
  // Write side already shut down: only waiting for the peer to close.
  bool halfClosed{false};
  bool peerClosed{false};
  bool waitingWritable{false};
};

}  // namespace hearth
