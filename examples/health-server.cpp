#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <hearth/hearth.hpp>
#include <hearth/log.hpp>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

using namespace hearth;

namespace {

struct HealthStatus {
  std::string status;
};

template <class T>
bool ParseNumber(std::string_view str, T& out) {
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), out);
  return errc == std::errc{} && ptr == str.data() + str.size();
}

void PrintUsage(const char* progName) {
  std::cerr << "Usage: " << progName
            << " [--port <port>] [--workers <nb>] [--drain-ms <ms>] [--log-level <trace|debug|info|warn|error>]\n"
            << "  --workers 0 (default) spawns one worker per CPU core\n";
}

}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 8080;
  uint32_t nbWorkers = 0;
  uint32_t drainMs = 5000;
  std::string_view logLevel = "info";

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return EXIT_SUCCESS;
    }
    if (argPos + 1 == argc) {
      std::cerr << "Missing value for option " << arg << '\n';
      PrintUsage(argv[0]);
      return EXIT_FAILURE;
    }
    const std::string_view value(argv[++argPos]);
    bool valid = true;
    if (arg == "--port") {
      valid = ParseNumber(value, port);
    } else if (arg == "--workers") {
      valid = ParseNumber(value, nbWorkers);
    } else if (arg == "--drain-ms") {
      valid = ParseNumber(value, drainMs);
    } else if (arg == "--log-level") {
      logLevel = value;
    } else {
      valid = false;
    }
    if (!valid) {
      std::cerr << "Invalid option " << arg << ' ' << value << '\n';
      PrintUsage(argv[0]);
      return EXIT_FAILURE;
    }
  }

  log::set_level(log::level::from_str(std::string(logLevel)));

  Router router;
  router.get("/health", [](const HttpRequest&, HttpResponseWriter& writer) { writer.send(HealthStatus{"healthy"}); });

  try {
    MultiProcessServer server(
        HttpServerConfig{}.withPort(port), std::move(router),
        WorkerConfig{}.withNbWorkers(nbWorkers).withDrainTimeout(std::chrono::milliseconds{drainMs}));
    return server.run();  // blocking, until SIGINT / SIGTERM
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
}
