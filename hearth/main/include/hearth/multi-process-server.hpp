#pragma once

#include <cstdint>

#include "hearth/http-server-config.hpp"
#include "hearth/router.hpp"
#include "hearth/worker-config.hpp"
#include "hearth/worker-supervisor.hpp"

namespace hearth {

// MultiProcessServer: runs one HttpServer per worker process, all bound to the same port with SO_REUSEPORT, so that
// the kernel distributes incoming connections between them.
//
//  - The calling (primary) process never binds the port: it only forks and supervises the workers
//    (see WorkerSupervisor).
//  - Each worker gets its own copy of the router and of the configuration. Nothing is shared between workers.
//  - On SIGINT / SIGTERM, workers drain their connections (up to WorkerConfig::drainTimeout) and exit, and the primary
//    returns once they are all reaped.
//
// Usage example:
//   Router router;
//   router.get("/health", [](const HttpRequest&, HttpResponseWriter& writer) { writer.send(...); });
//   MultiProcessServer server(HttpServerConfig{}.withPort(8080), std::move(router), WorkerConfig{});
//   return server.run();
class MultiProcessServer {
 public:
  // Validates both configurations. reusePort is forced to true.
  // Throws std::invalid_argument if a configuration is invalid or if the port is 0 (each worker binds independently,
  // so they cannot share an ephemeral port).
  MultiProcessServer(HttpServerConfig config, Router router, WorkerConfig workerConfig = {});

  MultiProcessServer(const MultiProcessServer&) = delete;
  MultiProcessServer(MultiProcessServer&&) = delete;
  MultiProcessServer& operator=(const MultiProcessServer&) = delete;
  MultiProcessServer& operator=(MultiProcessServer&&) = delete;

  ~MultiProcessServer() = default;

  // Installs the termination signal handlers, forks the workers and supervises them until a termination signal is
  // received or requestStop() is called. Blocking. Returns the exit code of the primary process.
  int run();

  // Stops the workers and makes run() return. Safe to call from any thread.
  void requestStop() noexcept { _supervisor.requestStop(); }

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] uint32_t nbWorkers() const noexcept { return _supervisor.nbWorkers(); }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

 private:
  // Entry point of each forked worker. Returns its exit code.
  int workerMain(uint32_t workerIndex);

  HttpServerConfig _config;
  Router _router;
  WorkerConfig _workerConfig;
  WorkerSupervisor _supervisor;
};

}  // namespace hearth
