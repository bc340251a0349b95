#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <hearth/hearth.hpp>
#include <iostream>
#include <utility>

using namespace hearth;

int main(int argc, char** argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  Router router;
  router.post("/echo", [](const HttpRequest& req, HttpResponseWriter& writer) { writer.send(req.body()); });
  router.get("/echo", [](const HttpRequest& req, HttpResponseWriter& writer) {
    Json reply = EmptyJsonObject();
    for (const auto& [key, value] : req.query()) {
      reply[key] = value;
    }
    writer.send(reply);
  });

  try {
    HttpServer server(HttpServerConfig{}.withPort(port), std::move(router));
    server.run();  // blocking run, until Ctrl+C
  } catch (const std::exception& e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
