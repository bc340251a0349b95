#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stop_token>
#include <string_view>
#include <thread>

#include "hearth/buffer-pool.hpp"
#include "hearth/connection-manager.hpp"
#include "hearth/connection-state.hpp"
#include "hearth/event-loop.hpp"
#include "hearth/http-server-config.hpp"
#include "hearth/http-status-code.hpp"
#include "hearth/internal/lifecycle.hpp"
#include "hearth/request-head-parser.hpp"
#include "hearth/response-cache.hpp"
#include "hearth/router.hpp"
#include "hearth/socket.hpp"
#include "hearth/timedef.hpp"

namespace hearth {

// HttpServer
//  - Single-threaded event loop: one instance == one epoll reactor running in the thread invoking run() / runUntil().
//  - Not internally synchronized, except beginDrain() and stop() which may be called from any thread.
//  - To use several CPU cores, run several processes binding the same port with SO_REUSEPORT. MultiProcessServer
//    does exactly this.
//
// Per request: the shutdown flag is checked first (503 'Server is shutting down'), then the route is resolved (404
// 'Not Found' when no handler matches), then the body is read into a pooled buffer (503 'Server is busy' when the
// pool is exhausted) and finally the handler is called (500 'Internal Server Error' if it throws).
class HttpServer {
 public:
  // AsyncHandle: RAII wrapper for non-blocking server execution
  // ------------------------------------------------------------
  // Returned by startDetached() to manage the background thread running the event loop.
  // Provides lifetime management (RAII join on destruction) and error propagation from the background thread.
  //
  // Typical usage:
  //   HttpServer server(cfg, router);
  //   auto handle = server.startDetached();  // non-blocking
  //   // ... do work while server runs in background ...
  //   handle.stop();  // or let handle destructor auto-stop
  //   handle.rethrowIfError();  // check for exceptions from event loop
  class AsyncHandle {
   public:
    AsyncHandle() noexcept = default;

    AsyncHandle(const AsyncHandle&) = delete;
    AsyncHandle& operator=(const AsyncHandle&) = delete;

    AsyncHandle(AsyncHandle&&) noexcept = default;
    AsyncHandle& operator=(AsyncHandle&&) noexcept = default;

    // Destructor automatically stops and joins the background thread (RAII)
    ~AsyncHandle();

    // Stop the background event loop and join the thread (blocking).
    // Safe to call multiple times; subsequent calls are no-ops.
    void stop() noexcept;

    // Rethrow any exception that occurred in the background event loop.
    // Call after stop() to check for errors.
    void rethrowIfError();

    // Check if the background thread is still active (not yet joined).
    [[nodiscard]] bool started() const noexcept { return _thread.joinable(); }

   private:
    friend class HttpServer;

    AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error);

    std::jthread _thread;
    std::shared_ptr<std::exception_ptr> _error;
  };

  // Construct a server bound and listening immediately according to given configuration.
  //  - Validates the configuration (std::invalid_argument).
  //  - Performs ::socket, setsockopt (REUSEADDR always, REUSEPORT if enabled), ::bind, ::listen,
  //    retrieves (and overwrites config.port with) the chosen ephemeral port if config.port == 0.
  //  - If any step fails it throws std::system_error (leaving no open fd).
  HttpServer(HttpServerConfig config, Router router);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  // Access to the router, to register handlers before running. Not to be modified while running.
  [[nodiscard]] Router& router() noexcept { return _router; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  // The port the server listens on (the effective one when the configured port was 0).
  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  // Run the event loop until stop() is called, a drain completes, or the process receives SIGINT/SIGTERM (the latter
  // starts a drain, see SignalHandler). Blocking for the caller thread.
  // Throws std::logic_error if the server is already running.
  void run();

  // Like run(), but also exits when 'predicate' returns true (checked once per loop iteration).
  // Remaining connections are closed on exit.
  void runUntil(const std::function<bool()>& predicate);

  // Launch the event loop in a background thread owned by this server, stopped and joined at destruction.
  void start();

  // Like start(), but returns an AsyncHandle for explicit lifetime management.
  // The handle must not outlive the server.
  [[nodiscard]] AsyncHandle startDetached();

  // Requests immediate termination of the event loop: the listener and all connections are closed.
  // Safe to invoke from another thread and from handlers. Not blocking: the loop exits at its next iteration.
  void stop() noexcept;

  // Starts a graceful drain: the listener is closed, idle connections are half closed, busy connections are half
  // closed once their current response is sent, and every new request is answered with 503. run() returns once all
  // connections are closed. If maxWait > 0, remaining connections are force closed after this duration.
  // Calling it again while draining can only shorten the deadline.
  // Safe to invoke from another thread and from handlers.
  void beginDrain(std::chrono::milliseconds maxWait = std::chrono::milliseconds{0}) noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  [[nodiscard]] bool isDraining() const noexcept { return _lifecycle.isDraining(); }

  // Number of active connections. Only meaningful from the event loop thread or when the server is not running.
  [[nodiscard]] std::size_t nbActiveConnections() const noexcept { return _connections.size(); }

  [[nodiscard]] const BufferPool& bufferPool() const noexcept { return _bufferPool; }

  [[nodiscard]] const ResponseCache& responseCache() const noexcept { return _responseCache; }

 private:
  friend class MultiProcessServer;

  void initListener();
  void prepareRun();
  void eventLoop();
  void maintenance(SteadyTimePoint now, bool sweepTick);
  void closeListener() noexcept;

  void handleReadableClient(int fd);
  void handleWritableClient(int fd);

  // Processes all complete requests buffered in the connection. Stops early once closeAfterFlush is set, in which
  // case the responses already queued are flushed before the close.
  void processInput(ConnectionState& state);

  void onRequestHead(ConnectionState& state, const RequestHeadParser::Result& result);

  void dispatch(ConnectionState& state);

  void emitStaticResponse(ConnectionState& state, http::StatusCode statusCode, std::string_view message,
                          bool keepAlive, bool headRequest = false);

  HttpServerConfig _config;
  Router _router;
  Socket _listenSocket;
  EventLoop _eventLoop;
  internal::Lifecycle _lifecycle;
  BufferPool _bufferPool;
  ResponseCache _responseCache;
  RequestHeadParser _headParser;
  ConnectionManager _connections;
  SteadyTimePoint _lastMaintenance;
  bool _drainApplied{false};
  bool _isInMultiProcessServer{false};
  AsyncHandle _internalHandle;
};

}  // namespace hearth
