#include "anvil/dispatch-core.hpp"

#include <exception>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "anvil/handler-error.hpp"
#include "anvil/handler.hpp"
#include "anvil/http-request.hpp"
#include "anvil/http-response.hpp"
#include "anvil/http-status-code.hpp"
#include "anvil/log.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/raw-response-sink.hpp"
#include "anvil/request-adapter.hpp"
#include "anvil/response-adapter.hpp"
#include "anvil/server-config.hpp"

namespace anvil {

namespace {

HandlerResult InvokeHandler(const Handler& handler, HttpRequest& request) {
  try {
    return handler.call(request);
  } catch (const std::exception& ex) {
    return std::unexpected(HandlerError("exception raised by handler: {}", ex.what()));
  } catch (...) {
    return std::unexpected(HandlerError(std::string("unknown exception raised by handler")));
  }
}

// The transport serves exactly one final response per connection, whose framing depends on its status.
HandlerResult CheckFinalResponse(HttpResponse&& response) {
  const auto status = response.status();
  if (http::IsInformational(status)) {
    return std::unexpected(HandlerError("informational status {} cannot be a final response", status));
  }
  if (!http::StatusAllowsBody(status) && !response.body().empty()) {
    return std::unexpected(HandlerError("status {} does not allow a response body", status));
  }
  return std::move(response);
}

}  // namespace

DispatchCore::DispatchCore(std::shared_ptr<const Handler> handler, ServerConfig config, Logger logger)
    : _handler(std::move(handler)), _config(std::move(config)), _logger(std::move(logger)) {
  if (!_handler) {
    throw std::invalid_argument("DispatchCore requires a non null handler");
  }
  if (!_logger) {
    _logger = log::default_logger();
  }
}

void DispatchCore::handleRequest(RawRequest rawRequest, RawResponseSink& rawResponse) const noexcept {
  try {
    auto request = AdaptRequest(std::move(rawRequest));
    if (!request) {
      _logger->error("Error getting request: {}", request.error());
      WriteBack(InternalServerErrorResponse(), rawResponse, *_logger);
      return;
    }

    HandlerResult result = InvokeHandler(*_handler, *request).and_then(CheckFinalResponse);
    if (result) {
      WriteBack(std::move(*result), rawResponse, *_logger);
    } else {
      _logger->error("Error handling {}: {}", *request, result.error());
      WriteBack(InternalServerErrorResponse(), rawResponse, *_logger);
    }
  } catch (const std::exception& ex) {
    // only reachable on memory exhaustion
    _logger->critical("Unable to serve request: {}", ex.what());
  }
}

}  // namespace anvil
