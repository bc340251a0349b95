// hearth Umbrella Header
//
// Include this single header to pull in the public API of the server:
//   - Server types (HttpServer, MultiProcessServer, WorkerSupervisor)
//   - Configuration types (HttpServerConfig, WorkerConfig)
//   - Routing, request and response writer types
//   - HTTP enums & helpers (methods, status codes, header names)
//
// Internal types (ConnectionState, RequestHeadParser, BodyReader...) are not re-exported.
//
// Usage Example:
//    #include <hearth/hearth.hpp>
//    using namespace hearth;
//    int main() {
//      Router router;
//      router.get("/health", [](const HttpRequest&, HttpResponseWriter& writer) {
//        writer.send(Json{{"status", "healthy"}});
//      });
//      HttpServer server(HttpServerConfig{}.withPort(8080), std::move(router));
//      server.run();
//    }

#pragma once

// Core server & wrappers
#include "hearth/http-server.hpp"           // IWYU pragma: export
#include "hearth/multi-process-server.hpp"  // IWYU pragma: export
#include "hearth/router.hpp"                // IWYU pragma: export
#include "hearth/worker-supervisor.hpp"     // IWYU pragma: export

// Configuration
#include "hearth/http-server-config.hpp"  // IWYU pragma: export
#include "hearth/signal-handler.hpp"      // IWYU pragma: export
#include "hearth/worker-config.hpp"       // IWYU pragma: export

// HTTP primitives
#include "hearth/http-request.hpp"          // IWYU pragma: export
#include "hearth/http-response-writer.hpp"  // IWYU pragma: export
#include "hearth/json.hpp"                  // IWYU pragma: export

// HTTP protocol enums & helpers
#include "hearth/http-constants.hpp"    // IWYU pragma: export
#include "hearth/http-method.hpp"       // IWYU pragma: export
#include "hearth/http-status-code.hpp"  // IWYU pragma: export
