#include "hearth/http-server.hpp"

#include <signal.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "hearth/connection-manager.hpp"
#include "hearth/connection-state.hpp"
#include "hearth/event-loop.hpp"
#include "hearth/event.hpp"
#include "hearth/http-method.hpp"
#include "hearth/http-response-writer.hpp"
#include "hearth/http-server-config.hpp"
#include "hearth/http-status-code.hpp"
#include "hearth/log.hpp"
#include "hearth/request-head-parser.hpp"
#include "hearth/router.hpp"
#include "hearth/signal-handler.hpp"
#include "hearth/socket.hpp"
#include "hearth/static-response.hpp"
#include "hearth/timedef.hpp"

namespace hearth {

namespace {

constexpr std::string_view kShuttingDownMessage = "Server is shutting down";
constexpr std::string_view kBusyMessage = "Server is busy";

HttpServerConfig Validated(HttpServerConfig config) {
  config.validate();
  return config;
}

std::string_view SignalName(int signum) {
  switch (signum) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal";
  }
}

}  // namespace

HttpServer::AsyncHandle::AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error)
    : _thread(std::move(thread)), _error(std::move(error)) {}

HttpServer::AsyncHandle::~AsyncHandle() { stop(); }

void HttpServer::AsyncHandle::stop() noexcept {
  if (_thread.joinable()) {
    _thread.request_stop();
    _thread.join();
  }
}

void HttpServer::AsyncHandle::rethrowIfError() {
  if (_error && *_error) {
    std::rethrow_exception(*_error);
  }
}

HttpServer::HttpServer(HttpServerConfig config, Router router)
    : _config(Validated(std::move(config))),
      _router(std::move(router)),
      _eventLoop(_config.pollInterval),
      _bufferPool(_config.bodyBufferBytes, _config.bodyBufferPoolSize),
      _responseCache(_config.responseCacheCapacity),
      _headParser(_config.maxHeaderBytes),
      _connections(_eventLoop, _config) {
  _router.setCacheCapacity(_config.routeCacheCapacity);
  _eventLoop.addOrThrow(EventLoop::EventFd{_lifecycle.wakeupFd.fd(), EventIn});
  initListener();
}

HttpServer::~HttpServer() {
  stop();
  _internalHandle.stop();
  closeListener();
}

// Binds and listens so that port() is valid right after construction.
// With port 0 the kernel picks an ephemeral port, written back into the configuration so that a later rebind (run
// after a drain) reuses the same port.
void HttpServer::initListener() {
  if (!_listenSocket) {
    _listenSocket = Socket(Socket::Type::StreamNonBlock);
  }
  _listenSocket.bindAndListen(_config.reusePort, _config.port);
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
}

void HttpServer::prepareRun() {
  if (_lifecycle.isActive()) {
    throw std::logic_error("Server is already running");
  }
  if (!_listenSocket) {
    initListener();
  }
  _drainApplied = false;
  _lastMaintenance = SteadyClock::now();
  if (!_isInMultiProcessServer) {
    // In MultiProcessServer, logging is done at that level instead.
    log::info("Server running on port :{}", port());
  }
}

void HttpServer::run() {
  prepareRun();
  _lifecycle.enterRunning();
  while (_lifecycle.isActive()) {
    eventLoop();
  }
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  prepareRun();
  _lifecycle.enterRunning();
  while (_lifecycle.isActive() && !predicate()) {
    eventLoop();
  }
  if (_lifecycle.isActive()) {
    // Stopped by the predicate: the listener stays open so that the server can be run again.
    _connections.closeAll();
    _lifecycle.reset();
  }
}

void HttpServer::start() { _internalHandle = startDetached(); }

HttpServer::AsyncHandle HttpServer::startDetached() {
  auto errorPtr = std::make_shared<std::exception_ptr>();

  return {std::jthread([this, errorPtr](const std::stop_token& st) {
            // Interrupt the poll immediately instead of waiting for its timeout.
            std::stop_callback wakeup(st, [this] { _lifecycle.wakeupFd.send(); });
            try {
              runUntil([&st]() { return st.stop_requested(); });
            } catch (const std::exception& ex) {
              log::error("Event loop terminated with exception: {}", ex.what());
              *errorPtr = std::current_exception();
            } catch (...) {
              log::error("Event loop terminated with unknown exception");
              *errorPtr = std::current_exception();
            }
          }),
          std::move(errorPtr)};
}

void HttpServer::stop() noexcept {
  const auto previousState = _lifecycle.exchangeStopping();
  if (previousState == internal::Lifecycle::State::Running || previousState == internal::Lifecycle::State::Draining) {
    log::debug("Stopping server");
    _lifecycle.wakeupFd.send();
  }
}

void HttpServer::beginDrain(std::chrono::milliseconds maxWait) noexcept {
  const bool hasDeadline = maxWait.count() > 0;
  const auto deadline = hasDeadline ? SteadyClock::now() + maxWait : SteadyTimePoint{};

  if (_lifecycle.isDraining()) {
    if (hasDeadline) {
      _lifecycle.shrinkDeadline(deadline);
      _lifecycle.wakeupFd.send();
    }
    return;
  }

  if (_lifecycle.exchangeDraining(deadline, hasDeadline) == internal::Lifecycle::State::Running) {
    if (hasDeadline) {
      log::info("Initiating graceful drain (deadline in {} ms)", maxWait.count());
    } else {
      log::info("Initiating graceful drain");
    }
    _lifecycle.wakeupFd.send();
  }
}

void HttpServer::closeListener() noexcept {
  if (_listenSocket) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
  }
}

void HttpServer::eventLoop() {
  const auto events = _eventLoop.poll();

  bool sweepTick = false;

  if (events.data() == nullptr) [[unlikely]] {
    _lifecycle.exchangeStopping();
  } else if (events.empty()) {
    // timeout / EINTR
    sweepTick = true;
  } else {
    for (auto event : events) {
      const int fd = event.fd;
      if (_listenSocket && fd == _listenSocket.fd()) {
        if (_lifecycle.isRunning()) {
          _connections.acceptAll(_listenSocket);
        }
      } else if (fd == _lifecycle.wakeupFd.fd()) {
        _lifecycle.wakeupFd.read();
      } else {
        const auto bmp = event.eventBmp;
        if ((bmp & EventOut) != 0) {
          handleWritableClient(fd);
        }
        // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
        // Treat them as a read trigger so we promptly observe EOF/errors and close.
        if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
          handleReadableClient(fd);
        }
      }
    }
  }

  // Under high load epoll_wait may return immediately and never hit the timeout path.
  const auto now = SteadyClock::now();
  if (now >= _lastMaintenance + _config.pollInterval) {
    sweepTick = true;
  }
  maintenance(now, sweepTick);
}

void HttpServer::maintenance(SteadyTimePoint now, bool sweepTick) {
  if (sweepTick) {
    _lastMaintenance = now;
    _connections.sweep(now);
  }

  if (_lifecycle.isStopping()) {
    _connections.closeAll();
    closeListener();
    _lifecycle.reset();
    log::info("Server stopped");
    return;
  }

  if (_lifecycle.isRunning()) {
    if (SignalHandler::IsStopRequested()) {
      log::info("Received {}. Starting graceful shutdown...", SignalName(SignalHandler::LastSignal()));
      beginDrain(SignalHandler::GetMaxDrainPeriod());
    } else {
      return;
    }
  }

  if (!_lifecycle.isDraining()) {
    return;
  }

  if (!_drainApplied) {
    _drainApplied = true;
    closeListener();
    if (!_connections.empty()) {
      log::info("Draining {} active connection(s)", _connections.size());
    }
    _connections.beginDrain();
  }

  if (_connections.empty()) {
    _lifecycle.reset();
    log::info("Server drained");
  } else if (_lifecycle.hasDeadline() && now >= _lifecycle.deadline()) {
    log::warn("Drain deadline reached with {} active connection(s); forcing close", _connections.size());
    _connections.closeAll();
    _lifecycle.reset();
    log::info("Server drained after deadline");
  }
}

void HttpServer::handleReadableClient(int fd) {
  ConnectionState* pState = _connections.find(fd);
  if (pState == nullptr) {
    // Closed earlier in the same event batch.
    return;
  }
  ConnectionState& state = *pState;
  const std::size_t maxBufferedBytes = _config.maxHeaderBytes + _config.bodyBufferBytes;

  ConnectionManager::ReadStatus readStatus;
  do {
    readStatus = _connections.read(state, maxBufferedBytes);
    if (readStatus == ConnectionManager::ReadStatus::Error) {
      _connections.close(fd);
      return;
    }
    if (state.halfClosed) {
      // Response side already shut down: nothing will ever be answered on this connection.
      state.inBuffer.clear();
    } else {
      processInput(state);
    }
  } while (readStatus == ConnectionManager::ReadStatus::BudgetReached && !state.closeAfterFlush);

  if (!_connections.flush(state)) {
    _connections.close(fd);
  }
}

void HttpServer::handleWritableClient(int fd) {
  ConnectionState* pState = _connections.find(fd);
  if (pState == nullptr) {
    return;
  }
  if (!_connections.flush(*pState)) {
    _connections.close(fd);
  }
}

void HttpServer::processInput(ConnectionState& state) {
  while (!state.closeAfterFlush) {
    if (state.phase == ConnectionState::Phase::Head) {
      if (state.inBuffer.empty()) {
        state.requestStart = {};
        return;
      }
      if (!state.hasRequestInProgress()) {
        state.requestStart = SteadyClock::now();
      }
      const auto result = _headParser.parse(state.inBuffer, state.request);
      if (result.status == RequestHeadParser::Result::Status::NeedMore) {
        return;
      }
      if (result.status == RequestHeadParser::Result::Status::Error) {
        log::debug("Malformed request head on fd # {}: {}", state.connection.fd(), result.errorCode);
        emitStaticResponse(state, result.errorCode, http::ReasonPhraseFor(result.errorCode), false);
        state.inBuffer.clear();
        return;
      }
      state.inBuffer.erase(0, result.headLength);
      onRequestHead(state, result);
      continue;
    }

    const auto [consumed, status] = state.bodyReader.feed(state.inBuffer);
    state.inBuffer.erase(0, consumed);
    switch (status) {
      case BodyReader::Status::NeedMore:
        return;
      case BodyReader::Status::Overflow:
        log::warn("Request body exceeds {} bytes on fd # {}, terminating connection", _bufferPool.bufferBytes(),
                  state.connection.fd());
        // Responses of requests pipelined before this one are still flushed before the close.
        state.bodyReader.reset();
        state.pHandler = nullptr;
        state.phase = ConnectionState::Phase::Head;
        state.inBuffer.clear();
        state.closeAfterFlush = true;
        return;
      case BodyReader::Status::Malformed:
        state.bodyReader.reset();
        state.phase = ConnectionState::Phase::Head;
        emitStaticResponse(state, http::StatusCodeBadRequest, http::ReasonPhraseFor(http::StatusCodeBadRequest),
                           false);
        state.inBuffer.clear();
        return;
      case BodyReader::Status::Complete:
        if (state.bodyReader.isDiscarding()) {
          state.bodyReader.reset();
        } else {
          state.request.setBody(state.bodyReader.finish());
        }
        state.phase = ConnectionState::Phase::Head;
        state.requestStart = {};
        dispatch(state);
        break;
      default:
        std::unreachable();
    }
  }
}

void HttpServer::onRequestHead(ConnectionState& state, const RequestHeadParser::Result& result) {
  const bool headRequest = state.request.method() == http::Method::HEAD;
  if (_lifecycle.isShuttingDown()) {
    emitStaticResponse(state, http::StatusCodeServiceUnavailable, kShuttingDownMessage, false, headRequest);
    state.inBuffer.clear();
    return;
  }

  state.pHandler = _router.resolve(state.request.method(), state.request.originalUrl());

  BufferPool::Lease lease;
  if (state.pHandler != nullptr && !http::IsBodylessMethod(state.request.method()) &&
      result.framing != BodyFraming::None) {
    auto optLease = _bufferPool.acquire();
    if (!optLease) {
      log::warn("Body buffer pool exhausted ({} buffers leased), rejecting request", _bufferPool.nbLeased());
      emitStaticResponse(state, http::StatusCodeServiceUnavailable, kBusyMessage, false, headRequest);
      state.inBuffer.clear();
      return;
    }
    lease = std::move(*optLease);
  }

  state.bodyReader.start(result.framing, result.contentLength, std::move(lease));
  state.phase = ConnectionState::Phase::Body;
}

void HttpServer::dispatch(ConnectionState& state) {
  const HttpRequest& request = state.request;
  const bool headRequest = request.method() == http::Method::HEAD;
  const bool keepAlive = request.keepAlive() && !_lifecycle.isShuttingDown();

  if (state.pHandler == nullptr) {
    emitStaticResponse(state, http::StatusCodeNotFound, http::ReasonPhraseFor(http::StatusCodeNotFound), keepAlive,
                       headRequest);
    return;
  }

  std::string cacheKey;
  if (_responseCache.capacity() != 0) {
    cacheKey = Router::BuildKey(request.method(), request.originalUrl());
  }

  HttpResponseWriter writer(state.outBuffer,
                            HttpResponseWriter::Context{.headRequest = headRequest,
                                                        .keepAlive = keepAlive,
                                                        .keepAliveTimeout = _config.keepAliveTimeout,
                                                        .pResponseCache = &_responseCache,
                                                        .cacheKey = cacheKey});
  bool handlerFailed = false;
  try {
    (*state.pHandler)(request, writer);
  } catch (const std::exception& ex) {
    log::error("Exception in handler for {} {}: {}", request.methodStr(), request.path(), ex.what());
    handlerFailed = true;
  } catch (...) {
    log::error("Unknown exception in handler for {} {}", request.methodStr(), request.path());
    handlerFailed = true;
  }
  state.pHandler = nullptr;

  if (!writer.sent()) {
    if (!handlerFailed) {
      log::error("Handler for {} {} returned without sending a response", request.methodStr(), request.path());
    }
    emitStaticResponse(state, http::StatusCodeInternalServerError,
                       http::ReasonPhraseFor(http::StatusCodeInternalServerError), keepAlive, headRequest);
    return;
  }
  if (!keepAlive) {
    state.closeAfterFlush = true;
  }
}

void HttpServer::emitStaticResponse(ConnectionState& state, http::StatusCode statusCode, std::string_view message,
                                    bool keepAlive, bool headRequest) {
  state.outBuffer.append(BuildStaticResponse(statusCode, message, keepAlive, headRequest));
  if (!keepAlive) {
    state.closeAfterFlush = true;
  }
}

}  // namespace hearth
