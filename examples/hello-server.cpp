#include <cstdlib>
#include <exception>

#include "hellonet/log.hpp"
#include "hellonet/server-config.hpp"
#include "hellonet/server-lifecycle.hpp"
#include "hellonet/signal-handler.hpp"

using namespace hellonet;

// Hello service: GET /hello answers 'Hello world'.
// Configured from the PORT, HOST and APP_ENV (or NODE_ENV) environment variables.
// Stopped with Ctrl+C (SIGINT) or SIGTERM.
int main() {
  log::InstallDefaultLogger();

  try {
    const ServerConfig config = LoadServerConfig();

    SignalHandler::Enable(config.maxDrainPeriod);

    ServerLifecycle server(config);
    return server.start();  // blocking run, until a termination signal
  } catch (const std::exception& ex) {
    log::critical("Server encountered error: {}", ex.what());
    return EXIT_FAILURE;
  }
}
