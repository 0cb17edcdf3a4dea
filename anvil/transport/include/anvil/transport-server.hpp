#pragma once

#include <concepts>
#include <utility>

#include "anvil/log.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/raw-response-sink.hpp"
#include "anvil/server-config.hpp"
#include "anvil/tcp-transport.hpp"

namespace anvil {

// What the transport needs from the object it serves: the address to bind and the per-request callback.
// The callback must be callable concurrently, the object is copied once per connection.
template <class T>
concept TransportServer = std::copy_constructible<T> && requires(const T& server, RawRequest rawRequest,
                                                                 RawResponseSink& sink) {
  { server.config() } -> std::convertible_to<const ServerConfig&>;
  server.handleRequest(std::move(rawRequest), sink);
};

// Binds the address returned by server.config() and serves it until a termination signal is received.
// Throws std::invalid_argument or std::system_error if the listener cannot be set up.
template <TransportServer Server>
void ServeForever(Server server, Logger logger = log::default_logger()) {
  ServerConfig config = server.config();
  TcpTransport transport(
      std::move(config),
      [server = std::move(server)](RawRequest rawRequest, RawResponseSink& sink) {
        server.handleRequest(std::move(rawRequest), sink);
      },
      std::move(logger));
  transport.run();
}

}  // namespace anvil
