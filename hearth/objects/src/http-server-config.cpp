#include "hearth/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace hearth {

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withRequestTimeout(std::chrono::milliseconds timeout) {
  this->requestTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBodyBufferBytes(std::size_t bodyBufferBytes) {
  this->bodyBufferBytes = bodyBufferBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBodyBufferPoolSize(std::size_t bodyBufferPoolSize) {
  this->bodyBufferPoolSize = bodyBufferPoolSize;
  return *this;
}

HttpServerConfig& HttpServerConfig::withRouteCacheCapacity(std::size_t capacity) {
  this->routeCacheCapacity = capacity;
  return *this;
}

HttpServerConfig& HttpServerConfig::withResponseCacheCapacity(std::size_t capacity) {
  this->responseCacheCapacity = capacity;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

void HttpServerConfig::validate() const {
  if (keepAliveTimeout.count() <= 0) {
    throw std::invalid_argument("keepAliveTimeout must be > 0");
  }
  if (requestTimeout.count() < 0) {
    throw std::invalid_argument("requestTimeout must be non-negative");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (bodyBufferBytes == 0) {
    throw std::invalid_argument("bodyBufferBytes must be > 0");
  }
  if (bodyBufferPoolSize == 0) {
    throw std::invalid_argument("bodyBufferPoolSize must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (pollInterval > std::chrono::hours{1}) {
    throw std::invalid_argument("Poll interval value is too large");
  }
}

}  // namespace hearth
