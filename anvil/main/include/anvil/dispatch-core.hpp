#pragma once

#include <memory>

#include "anvil/handler.hpp"
#include "anvil/log.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/raw-response-sink.hpp"
#include "anvil/server-config.hpp"

namespace anvil {

// The per-connection callback of the server: holds the shared handler, the bind configuration and the logger.
//
// Copying a DispatchCore is cheap (the handler is shared, never duplicated): the transport makes one copy per
// accepted connection. handleRequest is const and does not touch any shared mutable state, so any number of copies
// can run at the same time, each from its own thread.
class DispatchCore {
 public:
  // Throws std::invalid_argument if 'handler' is null. A null logger means the spdlog default logger.
  DispatchCore(std::shared_ptr<const Handler> handler, ServerConfig config, Logger logger = log::default_logger());

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const Handler& handler() const noexcept { return *_handler; }

  // Number of DispatchCore objects (and other owners) sharing the handler.
  [[nodiscard]] long handlerUseCount() const noexcept { return _handler.use_count(); }

  // Serves one exchange: adapts 'rawRequest', invokes the handler and writes exactly one response into 'rawResponse'.
  //  - adaptation failure: error logged, 500 "Internal Server Error" written, handler not invoked
  //  - handler error (returned or thrown): error logged with the request, 500 "Internal Server Error" written
  //  - handler response: written as is
  // Never throws.
  void handleRequest(RawRequest rawRequest, RawResponseSink& rawResponse) const noexcept;

 private:
  std::shared_ptr<const Handler> _handler;
  ServerConfig _config;
  Logger _logger;
};

}  // namespace anvil
