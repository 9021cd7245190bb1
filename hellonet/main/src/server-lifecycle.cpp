#include "hellonet/server-lifecycle.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "hellonet/connection.hpp"
#include "hellonet/event.hpp"
#include "hellonet/http-constants.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/log.hpp"
#include "hellonet/request-context.hpp"
#include "hellonet/request-parser.hpp"
#include "hellonet/server-config.hpp"
#include "hellonet/signal-handler.hpp"
#include "hellonet/socket-ops.hpp"
#include "hellonet/socket.hpp"
#include "hellonet/timedef.hpp"

namespace hellonet {

namespace {

constexpr std::size_t kReadChunkSize = 4096;

constexpr EventBmp kClientEvents = EventIn | EventOut | EventRdHup | EventEt;

// Serializes the finalized response at the end of the connection output buffer.
class BufferedResponseSink final : public ResponseSink {
 public:
  explicit BufferedResponseSink(std::string& outBuffer) noexcept : _outBuffer(outBuffer) {}

 protected:
  void commit(const HttpResponse& response) override { response.appendTo(_outBuffer); }

 private:
  std::string& _outBuffer;
};

}  // namespace

std::string_view ServerStateToStr(ServerState state) noexcept {
  switch (state) {
    case ServerState::Initializing:
      return "Initializing";
    case ServerState::Binding:
      return "Binding";
    case ServerState::Listening:
      return "Listening";
    case ServerState::Draining:
      return "Draining";
    case ServerState::Stopped:
      return "Stopped";
    case ServerState::Errored:
      return "Errored";
    default:
      return "Unknown";
  }
}

std::string_view ServerLifecycle::StopCauseToStr(StopCause cause) noexcept {
  switch (cause) {
    case StopCause::Signal:
      return "signal";
    case StopCause::StopCall:
      return "stop request";
    case StopCause::Fault:
      return "fault";
    default:
      return "unknown";
  }
}

ServerLifecycle::ServerLifecycle(ServerConfig config, const RouteTable& routeTable)
    : _config(std::move(config)),
      _routeTable(routeTable),
      _router(_routeTable),
      _eventLoop(_config.pollInterval) {
  _config.validate();
}

void ServerLifecycle::setState(ServerState state) noexcept {
  const ServerState previous = _state.exchange(state, std::memory_order_acq_rel);
  log::debug("Server state {} -> {}", ServerStateToStr(previous), ServerStateToStr(state));
}

int ServerLifecycle::start() {
  if (_started.exchange(true)) {
    throw std::logic_error("ServerLifecycle::start() can only be called once");
  }

  setState(ServerState::Binding);
  if (!bindAndRegister()) {
    setState(ServerState::Errored);
    return EXIT_FAILURE;
  }

  _port.store(_listenSocket.localPort(), std::memory_order_release);
  setState(ServerState::Listening);

  log::info("Server listening on {} (pid {}, environment: {})", _listenSocket.localAddress(), ::getpid(),
            _config.environment);
  log::info("Hello endpoint available at http://{}:{}/hello", _config.host, port());

  while (true) {
    const ServerState state = this->state();
    if (state != ServerState::Listening && state != ServerState::Draining) {
      break;
    }
    eventLoop();
  }

  return _exitStatus;
}

void ServerLifecycle::stop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _wakeupFd.send();
}

bool ServerLifecycle::bindAndRegister() {
  try {
    _listenSocket = Socket::BindAndListen(_config.host, _config.port, _config.backlog);
    _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
    _eventLoop.addOrThrow(EventLoop::EventFd{_wakeupFd.fd(), EventIn});
  } catch (const std::system_error& ex) {
    logBindFailure(ex);
    _listenSocket.close();
    return false;
  }
  return true;
}

void ServerLifecycle::logBindFailure(const std::system_error& ex) const {
  switch (ex.code().value()) {
    case EADDRINUSE:
      log::error("Port {} is already in use on {}. Stop the other process or choose another PORT.", _config.port,
                 _config.host);
      break;
    case EACCES:
      log::error("Permission denied while binding {}:{}. Choose a port >= {}.", _config.host, _config.port,
                 ServerConfig::kMinPort);
      break;
    case EADDRNOTAVAIL:
      log::error("Address {} is not available on this machine. Check the HOST environment variable.", _config.host);
      break;
    default:
      log::error("Failed to start server on {}:{}: {}", _config.host, _config.port, ex.what());
      break;
  }
}

void ServerLifecycle::eventLoop() {
  const auto events = _eventLoop.poll();

  if (events.data() == nullptr) [[unlikely]] {
    log::error("Event loop failure, closing {} connection(s)", _connections.size());
    closeAllConnections();
    closeListener();
    _exitStatus = EXIT_FAILURE;
    setState(ServerState::Errored);
    return;
  }

  for (const auto event : events) {
    const int fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _wakeupFd.fd()) {
      _wakeupFd.read();
    } else {
      try {
        const auto bmp = event.eventBmp;
        if ((bmp & EventOut) != 0) {
          handleWritableClient(fd);
        }
        // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
        if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
          handleReadableClient(fd);
        }
      } catch (const std::exception& ex) {
        log::error("Unexpected error while processing connection fd # {}: {}", fd, ex.what());
        closeConnection(fd);
        beginDrain(StopCause::Fault);
      }
    }
  }

  const auto now = SteadyClock::now();

  checkStopRequests();
  sweepIdleConnections(now);

  if (state() == ServerState::Draining) {
    checkDrainCompletion(now);
  }
}

void ServerLifecycle::checkStopRequests() {
  const uint32_t nbSignals = SignalHandler::NbStopRequests();
  while (_nbHandledSignals < nbSignals) {
    ++_nbHandledSignals;
    log::info("Received signal {}", SignalHandler::ReceivedSignal());
    beginDrain(StopCause::Signal);
  }
  if (_stopRequested.exchange(false, std::memory_order_acq_rel)) {
    beginDrain(StopCause::StopCall);
  }
}

void ServerLifecycle::acceptNewConnections() {
  const auto now = SteadyClock::now();
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      break;
    }
    const int cnxFd = cnx.fd();
    if (!_eventLoop.add(EventLoop::EventFd{cnxFd, kClientEvents})) {
      // Connection closes on scope exit.
      continue;
    }
    log::info("New client connection established from {}", cnx.peer());
    _connections.emplace(cnxFd, ConnectionState{.cnx = std::move(cnx), .lastActivity = now});
  }
}

void ServerLifecycle::handleReadableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& cnxState = cnxIt->second;

  bool peerClosed = false;
  char chunk[kReadChunkSize];
  while (true) {
    const auto nbRead = SafeRecv(fd, chunk, sizeof(chunk));
    if (nbRead > 0) {
      cnxState.inBuffer.append(chunk, static_cast<std::size_t>(nbRead));
      continue;
    }
    if (nbRead == 0) {
      peerClosed = true;
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    log::debug("Read error on connection from {}: {}", cnxState.cnx.peer(), std::strerror(errno));
    closeConnection(cnxIt);
    return;
  }

  cnxState.lastActivity = SteadyClock::now();

  processRequests(cnxState);

  if (!flushOutbound(cnxState)) {
    closeConnection(cnxIt);
    return;
  }

  if (peerClosed) {
    log::debug("Peer {} closed the connection", cnxState.cnx.peer());
    cnxState.closeAfterWrite = true;
  }
  if (cnxState.closeAfterWrite && !cnxState.hasPendingOutput()) {
    closeConnection(cnxIt);
  }
}

void ServerLifecycle::handleWritableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& cnxState = cnxIt->second;
  if (!cnxState.hasPendingOutput()) {
    return;
  }
  if (!flushOutbound(cnxState)) {
    closeConnection(cnxIt);
    return;
  }
  cnxState.lastActivity = SteadyClock::now();
  if (cnxState.closeAfterWrite && !cnxState.hasPendingOutput()) {
    closeConnection(cnxIt);
  }
}

void ServerLifecycle::processRequests(ConnectionState& cnxState) {
  while (!cnxState.closeAfterWrite && !cnxState.inBuffer.empty()) {
    ParseResult result = ParseRequestHead(cnxState.inBuffer, _config.maxHeaderBytes, _config.maxBodyBytes);
    if (result.status == ParseResult::Status::NeedMore) {
      break;
    }
    if (result.status == ParseResult::Status::Malformed) {
      log::warn("Malformed request from {}: {}", cnxState.cnx.peer(), result.reason);
      cnxState.inBuffer.clear();
      cnxState.outBuffer.append(http::BadRequestReply);
      cnxState.closeAfterWrite = true;
      break;
    }

    RequestHead& head = result.head;
    const std::size_t requestSize = head.headLength + head.contentLength;
    if (cnxState.inBuffer.size() < requestSize) {
      // body not fully received yet
      break;
    }

    RequestContext ctx(head.method, head.target, head.version, std::move(head.headers));
    if (_beforeRoute) {
      _beforeRoute(ctx);
    }
    BufferedResponseSink sink(cnxState.outBuffer);
    _router.route(ctx, sink);

    cnxState.inBuffer.erase(0, requestSize);
    if (!ctx.keepAlive() || state() == ServerState::Draining) {
      cnxState.closeAfterWrite = true;
      cnxState.inBuffer.clear();
    }
  }
}

bool ServerLifecycle::flushOutbound(ConnectionState& cnxState) {
  while (cnxState.hasPendingOutput()) {
    const auto nbSent =
        SafeSend(cnxState.cnx.fd(), cnxState.outBuffer.data() + cnxState.outOffset, cnxState.outBuffer.size() - cnxState.outOffset);
    if (nbSent > 0) {
      cnxState.outOffset += static_cast<std::size_t>(nbSent);
      continue;
    }
    if (nbSent == -1 && errno == EINTR) {
      continue;
    }
    if (nbSent == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // resumed on next EPOLLOUT edge
      return true;
    }
    log::debug("Write error on connection from {}: {}", cnxState.cnx.peer(), std::strerror(errno));
    return false;
  }
  cnxState.outBuffer.clear();
  cnxState.outOffset = 0;
  return true;
}

ServerLifecycle::ConnectionMap::iterator ServerLifecycle::closeConnection(ConnectionMap::iterator cnxIt) {
  const int cnxFd = cnxIt->first;
  log::debug("Closing connection from {} (fd # {})", cnxIt->second.cnx.peer(), cnxFd);
  _eventLoop.del(cnxFd);
  if (!ShutdownWrite(cnxFd)) {
    log::trace("shutdown(fd # {}) failed: {}", cnxFd, std::strerror(errno));
  }
  return _connections.erase(cnxIt);
}

void ServerLifecycle::closeConnection(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt != _connections.end()) {
    closeConnection(cnxIt);
  }
}

void ServerLifecycle::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

void ServerLifecycle::closeListener() noexcept {
  if (_listenSocket) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
  }
}

void ServerLifecycle::sweepIdleConnections(SteadyTimePoint now) {
  const bool draining = state() == ServerState::Draining;
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    const ConnectionState& cnxState = cnxIt->second;
    if (draining && !cnxState.inFlight()) {
      cnxIt = closeConnection(cnxIt);
    } else if (now - cnxState.lastActivity > _config.idleTimeout) {
      log::debug("Closing idle connection from {}", cnxState.cnx.peer());
      cnxIt = closeConnection(cnxIt);
    } else {
      ++cnxIt;
    }
  }
}

void ServerLifecycle::beginDrain(StopCause cause) {
  if (cause == StopCause::Fault) {
    _exitStatus = EXIT_FAILURE;
  }
  const ServerState current = state();
  if (current == ServerState::Draining) {
    log::warn("Shutdown already in progress, ignoring {}", StopCauseToStr(cause));
    return;
  }
  if (current != ServerState::Listening) {
    return;
  }

  const auto maxDrainPeriod =
      cause == StopCause::Signal ? SignalHandler::GetMaxDrainPeriod() : _config.maxDrainPeriod;

  log::info("Graceful shutdown initiated by {}, {} open connection(s)", StopCauseToStr(cause), _connections.size());

  setState(ServerState::Draining);
  closeListener();

  _drainDeadlineEnabled = maxDrainPeriod.count() > 0;
  if (_drainDeadlineEnabled) {
    _drainDeadline = SteadyClock::now() + maxDrainPeriod;
  }

  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    if (cnxIt->second.inFlight()) {
      ++cnxIt;
    } else {
      cnxIt = closeConnection(cnxIt);
    }
  }
}

void ServerLifecycle::checkDrainCompletion(SteadyTimePoint now) {
  if (_connections.empty()) {
    setState(ServerState::Stopped);
    log::info("Server stopped");
    return;
  }
  if (_drainDeadlineEnabled && now >= _drainDeadline) {
    log::warn("Drain period expired, forcing close of {} connection(s)", _connections.size());
    closeAllConnections();
    _exitStatus = EXIT_FAILURE;
    setState(ServerState::Stopped);
    log::info("Server stopped");
  }
}

}  // namespace hellonet
