#include "hearth/multi-process-server.hpp"

#include <unistd.h>

#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "hearth/http-server-config.hpp"
#include "hearth/http-server.hpp"
#include "hearth/log.hpp"
#include "hearth/router.hpp"
#include "hearth/signal-handler.hpp"
#include "hearth/worker-config.hpp"

namespace hearth {

namespace {

HttpServerConfig PrepareWorkerServerConfig(HttpServerConfig config) {
  if (config.port == 0) {
    throw std::invalid_argument("MultiProcessServer requires an explicit port");
  }
  config.reusePort = true;
  config.validate();
  return config;
}

}  // namespace

MultiProcessServer::MultiProcessServer(HttpServerConfig config, Router router, WorkerConfig workerConfig)
    : _config(PrepareWorkerServerConfig(std::move(config))),
      _router(std::move(router)),
      _workerConfig(std::move(workerConfig)),
      _supervisor(_workerConfig, [this](uint32_t workerIndex) { return workerMain(workerIndex); }) {}

int MultiProcessServer::run() {
  SignalHandler::Enable(_workerConfig.drainTimeout);
  log::info("Starting {} worker(s) on port {}", _supervisor.nbWorkers(), _config.port);
  return _supervisor.run();
}

int MultiProcessServer::workerMain(uint32_t workerIndex) {
  try {
    HttpServer server(_config, _router);
    server._isInMultiProcessServer = true;
    log::info("Worker {} listening on port {}", ::getpid(), server.port());
    server.run();
    log::info("Worker {} (slot {}) exiting", ::getpid(), workerIndex);
    return 0;
  } catch (const std::system_error& ex) {
    log::critical("Worker {} (slot {}) failed to start: {}", ::getpid(), workerIndex, ex.what());
    return 1;
  }
}

}  // namespace hearth
