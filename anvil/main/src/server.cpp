#include "anvil/server.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "anvil/dispatch-core.hpp"
#include "anvil/log.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/raw-response-sink.hpp"
#include "anvil/server-config.hpp"
#include "anvil/tcp-transport.hpp"
#include "anvil/transport-server.hpp"

namespace anvil {

static_assert(TransportServer<DispatchCore>);

Server Server::Around(std::unique_ptr<Handler> handler, Logger logger) {
  if (!handler) {
    throw std::invalid_argument("Server requires a non null handler");
  }
  if (!logger) {
    logger = log::default_logger();
  }
  return {std::move(handler), std::move(logger)};
}

void Server::listen(std::string_view ip, uint16_t port) && {
  ServerConfig config;
  config.withIpAddress(ip).withPort(port);
  std::move(*this).listen(std::move(config));
}

void Server::listen(ServerConfig config) && {
  config.validate();
  Logger logger = _logger;
  ServeForever(DispatchCore(std::move(_handler), std::move(config), logger), std::move(logger));
}

ListeningServer Server::bind(ServerConfig config) && {
  Logger logger = _logger;
  return {DispatchCore(std::move(_handler), std::move(config), logger), std::move(logger)};
}

ListeningServer::ListeningServer(DispatchCore core, Logger logger) {
  ServerConfig config = core.config();
  _transport = std::make_unique<TcpTransport>(
      std::move(config),
      [core = std::move(core)](RawRequest rawRequest, RawResponseSink& sink) {
        core.handleRequest(std::move(rawRequest), sink);
      },
      std::move(logger));
}

}  // namespace anvil
