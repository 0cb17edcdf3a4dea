#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "anvil/dispatch-core.hpp"
#include "anvil/handler.hpp"
#include "anvil/log.hpp"
#include "anvil/server-config.hpp"
#include "anvil/tcp-transport.hpp"

namespace anvil {

class ListeningServer;

// Entry point of anvil: wraps exactly one Handler and serves it over HTTP.
//
//   anvil::Server::Around([](anvil::HttpRequest&) { return anvil::HttpResponse("Hello World"); })
//       .listen("0.0.0.0", 8080);
//
// A Server is consumed when it starts listening, so it is used through rvalues only.
class Server {
 public:
  // Takes ownership of 'handler'. Throws std::invalid_argument if it is null.
  // The logger is used for every error happening while serving requests (spdlog default logger if null).
  static Server Around(std::unique_ptr<Handler> handler, Logger logger = log::default_logger());

  // Builds a Server from a callable 'HandlerResult(HttpRequest&)' (or returning a plain HttpResponse).
  template <HandlerFunction Func>
  static Server Around(Func func, Logger logger = log::default_logger()) {
    return Around(MakeHandler(std::move(func)), std::move(logger));
  }

  // Binds 'ip':'port' and serves requests on it.
  // This call blocks and does not return under normal operation: it should be the last statement of program
  // startup. It only returns when a termination signal is received (if SignalHandler::Enable() has been called).
  // Throws std::invalid_argument if 'ip' is not a valid IP address and std::system_error if the address cannot
  // be bound.
  void listen(std::string_view ip, uint16_t port) &&;

  // Same as above with a full configuration.
  void listen(ServerConfig config) &&;

  // Binds immediately and returns an object serving requests on demand. Useful for ephemeral ports and for
  // servers that should stop on their own.
  // Throws std::invalid_argument for an invalid config and std::system_error if the address cannot be bound.
  [[nodiscard]] ListeningServer bind(ServerConfig config) &&;

 private:
  Server(std::unique_ptr<Handler> handler, Logger logger) noexcept
      : _handler(std::move(handler)), _logger(std::move(logger)) {}

  std::unique_ptr<Handler> _handler;
  Logger _logger;
};

// A bound server, ready to serve requests for the handler it was built from.
// serveForever / serveUntil block the calling thread; stop() may be called from any thread.
class ListeningServer {
 public:
  // The effective bound port (the OS chosen one if 0 was configured).
  [[nodiscard]] uint16_t port() const noexcept { return _transport->port(); }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _transport->config(); }

  // Serves until stop() is called or a termination signal is received.
  void serveForever() { _transport->run(); }

  // Serves until 'predicate' returns true, stop() is called or a termination signal is received.
  void serveUntil(const std::function<bool()>& predicate) { _transport->runUntil(predicate); }

  // Requests serveForever / serveUntil to return. Requests already accepted are answered.
  void stop() noexcept { _transport->stop(); }

 private:
  friend class Server;

  ListeningServer(DispatchCore core, Logger logger);

  std::unique_ptr<TcpTransport> _transport;
};

}  // namespace anvil
