#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

#include "hellonet/connection.hpp"
#include "hellonet/event-fd.hpp"
#include "hellonet/event-loop.hpp"
#include "hellonet/request-context.hpp"
#include "hellonet/route-table.hpp"
#include "hellonet/router.hpp"
#include "hellonet/server-config.hpp"
#include "hellonet/socket.hpp"
#include "hellonet/timedef.hpp"

namespace hellonet {

// Lifecycle of the server process, in order:
//   Initializing -> Binding -> Listening -> Draining -> Stopped
// Binding may end in Errored (address in use, permission denied ...), as may an unrecoverable event loop failure.
enum class ServerState : uint8_t { Initializing, Binding, Listening, Draining, Stopped, Errored };

std::string_view ServerStateToStr(ServerState state) noexcept;

// Single threaded, epoll based HTTP/1.1 server owning the listening socket and all client connections.
//
// start() blocks the calling thread until the server is stopped, either by:
//  - a termination signal (see SignalHandler) or a call to stop() from any thread: graceful drain, exit status 0
//  - a fault while processing a connection: graceful drain, exit status 1
// During the drain, the listener is closed first, idle connections are closed immediately and connections with a
// request in flight are given up to maxDrainPeriod (0: no limit) to complete before being forcibly closed
// (exit status 1).
class ServerLifecycle {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  // The route table is copied.
  explicit ServerLifecycle(ServerConfig config, const RouteTable& routeTable = DefaultRouteTable());

  ServerLifecycle(const ServerLifecycle&) = delete;
  ServerLifecycle(ServerLifecycle&&) noexcept = delete;
  ServerLifecycle& operator=(const ServerLifecycle&) = delete;
  ServerLifecycle& operator=(ServerLifecycle&&) noexcept = delete;

  ~ServerLifecycle() = default;

  // Binds, listens and serves until stopped. Returns the process exit status (EXIT_SUCCESS / EXIT_FAILURE).
  // Throws std::logic_error if called more than once.
  int start();

  // Requests a graceful shutdown. Thread safe, may be called before start() or several times.
  void stop() noexcept;

  [[nodiscard]] ServerState state() const noexcept { return _state.load(std::memory_order_acquire); }

  // Port actually bound, 0 until the server is listening.
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(std::memory_order_acquire); }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

 private:
  friend class FaultDrainTest;

  enum class StopCause : uint8_t { Signal, StopCall, Fault };

  struct ConnectionState {
    // A request is in flight while unprocessed input or unsent output remains.
    [[nodiscard]] bool inFlight() const noexcept { return !inBuffer.empty() || outOffset < outBuffer.size(); }

    [[nodiscard]] bool hasPendingOutput() const noexcept { return outOffset < outBuffer.size(); }

    Connection cnx;
    std::string inBuffer;
    std::string outBuffer;
    std::size_t outOffset{};
    SteadyTimePoint lastActivity;
    bool closeAfterWrite{false};
  };

  using ConnectionMap = std::unordered_map<int, ConnectionState>;

  static std::string_view StopCauseToStr(StopCause cause) noexcept;

  void setState(ServerState state) noexcept;

  bool bindAndRegister();

  void logBindFailure(const std::system_error& ex) const;

  void eventLoop();

  void checkStopRequests();

  void acceptNewConnections();

  void handleReadableClient(int fd);

  void handleWritableClient(int fd);

  void processRequests(ConnectionState& cnxState);

  // Sends as much pending output as the socket accepts. Returns false on a fatal write error.
  bool flushOutbound(ConnectionState& cnxState);

  ConnectionMap::iterator closeConnection(ConnectionMap::iterator cnxIt);

  void closeConnection(int fd);

  void closeAllConnections();

  void closeListener() noexcept;

  void sweepIdleConnections(SteadyTimePoint now);

  void beginDrain(StopCause cause);

  void checkDrainCompletion(SteadyTimePoint now);

  // Invoked before routing each complete request, outside of the Router error boundary.
  std::function<void(const RequestContext&)> _beforeRoute;
  ServerConfig _config;
  RouteTable _routeTable;
  Router _router;
  Socket _listenSocket;
  EventLoop _eventLoop;
  EventFd _wakeupFd;
  ConnectionMap _connections;
  SteadyTimePoint _drainDeadline;
  std::atomic<ServerState> _state{ServerState::Initializing};
  std::atomic<uint16_t> _port{0};
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _started{false};
  uint32_t _nbHandledSignals{0};
  int _exitStatus{0};
  bool _drainDeadlineEnabled{false};
};

}  // namespace hellonet
