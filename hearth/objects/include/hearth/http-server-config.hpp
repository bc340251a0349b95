#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace hearth {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT allowing several independent listeners (typically one per worker process) to bind
  // the same port, the kernel distributing incoming connections between them. Disabled by default.
  bool reusePort{false};

  // TCP_NODELAY disables the Nagle algorithm on accepted connections, trading network efficiency for lower latency
  // of small request-response exchanges. Default: true.
  bool tcpNoDelay{true};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================

  // Idle timeout for keep-alive connections (duration to wait for next request after previous response is fully
  // sent). Once exceeded the server proactively closes the connection. Also advertised to clients through the
  // 'Keep-Alive: timeout=<ms>' response header and used as the TCP keepalive idle delay. Default: 5000 ms.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // Maximum duration allowed to fully receive a request (head and body) from its first byte. If exceeded the server
  // replies 408 Request Timeout and closes the connection. 0 disables it. Default: 5000 ms.
  std::chrono::milliseconds requestTimeout{std::chrono::milliseconds{5000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum allowed size (in bytes) of the aggregate HTTP request head (request line + all headers + CRLFCRLF).
  // If exceeded while parsing, the server replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Capacity of each pooled body buffer, which is also the largest accepted request body. A body exceeding it
  // terminates the connection. Default: 16 KiB.
  std::size_t bodyBufferBytes{16384};

  // Maximum number of body buffers that can be leased at the same time. When all are in use, requests with a body
  // are answered 503. Buffers are allocated lazily. Default: 1000.
  std::size_t bodyBufferPoolSize{1000};

  // ===========================================
  // Caches
  // ===========================================
  // Capacity (entries) of the observed URL -> handler cache of the router. 0 disables it. Default: 1024.
  std::size_t routeCacheCapacity{1024};

  // Capacity (entries) of the serialized 200 responses cache. 0 disables it. Default: 1024.
  std::size_t responseCacheCapacity{1024};

  // ===========================================
  // Event loop polling / responsiveness tuning
  // ===========================================
  // Maximum duration the event loop will block waiting for I/O when idle before it wakes to perform housekeeping
  // (timeouts, drain completion, signal checks). Epoll still returns early when I/O events arrive, so this is only a
  // cap on the latency of housekeeping when idle. Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withRequestTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withBodyBufferBytes(std::size_t bodyBufferBytes);

  HttpServerConfig& withBodyBufferPoolSize(std::size_t bodyBufferPoolSize);

  HttpServerConfig& withRouteCacheCapacity(std::size_t capacity);

  HttpServerConfig& withResponseCacheCapacity(std::size_t capacity);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace hearth
