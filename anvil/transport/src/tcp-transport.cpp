#include "anvil/tcp-transport.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "anvil/beast-response-sink.hpp"
#include "anvil/beast-string-view.hpp"
#include "anvil/http-constants.hpp"
#include "anvil/http-status-code.hpp"
#include "anvil/log.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/server-config.hpp"
#include "anvil/signal-handler.hpp"
#include "anvil/system-error.hpp"

namespace anvil {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

// Everything a connection thread needs, owned by the thread itself.
struct Connection {
  tcp::endpoint remoteEndpoint;
  RequestCallback callback;
  Logger logger;
  std::size_t maxHeaderBytes;
  std::size_t maxBodyBytes;
  std::chrono::milliseconds readTimeout;
};

beast::http::status WireErrorStatus(const beast::error_code& ec) {
  if (ec == beast::http::error::body_limit) {
    return beast::http::status::payload_too_large;
  }
  if (ec == beast::http::error::header_limit) {
    return beast::http::status::request_header_fields_too_large;
  }
  return beast::http::status::bad_request;
}

std::string_view ErrorBody(beast::http::status status) {
  switch (status) {
    case beast::http::status::request_timeout:
      return http::ReasonRequestTimeout;
    case beast::http::status::payload_too_large:
      return http::ReasonPayloadTooLarge;
    case beast::http::status::request_header_fields_too_large:
      return http::ReasonRequestHeaderFieldsTooLarge;
    case beast::http::status::internal_server_error:
      return http::ReasonInternalServerError;
    default:
      return http::ReasonBadRequest;
  }
}

// Responses to HEAD only carry the head. 1xx, 204 and 304 responses are sent without any framing header.
void WriteAndClose(tcp::socket& socket, BeastResponseSink::Message& response, bool headOnly, const Connection& cnx) {
  response.keep_alive(false);
  if (http::StatusAllowsBody(static_cast<http::StatusCode>(response.result_int()))) {
    response.prepare_payload();
  } else {
    response.body().clear();
    response.erase(beast::http::field::content_length);
    response.erase(beast::http::field::transfer_encoding);
  }

  beast::error_code ec;
  beast::http::response_serializer<beast::http::string_body> serializer(response);
  if (headOnly) {
    beast::http::write_header(socket, serializer, ec);
  } else {
    beast::http::write(socket, serializer, ec);
  }
  if (ec) {
    cnx.logger->error("Error writing response to {}:{}: {}", cnx.remoteEndpoint.address().to_string(),
                      cnx.remoteEndpoint.port(), ec.message());
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
  socket.close(ec);
}

void WriteErrorAndClose(tcp::socket& socket, beast::http::status status, unsigned version, bool headOnly,
                        const Connection& cnx) {
  BeastResponseSink::Message response{status, version == 10U ? 10U : 11U};
  response.set(beast::http::field::content_type, ToBeastStringView(http::ContentTypeTextPlain));
  response.body().assign(ErrorBody(status));
  WriteAndClose(socket, response, headOnly, cnx);
}

void RejectRequest(tcp::socket& socket, const beast::error_code& readError, unsigned version, const Connection& cnx) {
  const auto status = WireErrorStatus(readError);
  cnx.logger->warn("Rejecting request from {}:{} with status {}: {}", cnx.remoteEndpoint.address().to_string(),
                   cnx.remoteEndpoint.port(), static_cast<unsigned>(status), readError.message());
  WriteErrorAndClose(socket, status, version, false, cnx);
}

bool IsWireError(const beast::error_code& ec) {
  return ec.category() == beast::http::make_error_code(beast::http::error::bad_target).category();
}

// Reads one full request, cancelling the read when the connection read timeout expires first.
// Returns true if the deadline expired.
bool ReadRequest(asio::io_context& ioContext, tcp::socket& socket, beast::flat_buffer& buffer,
                 beast::http::request_parser<beast::http::string_body>& parser, const Connection& cnx,
                 beast::error_code& ec) {
  bool readDone = false;
  bool timedOut = false;
  asio::steady_timer deadline(ioContext);
  if (cnx.readTimeout.count() != 0) {
    deadline.expires_after(cnx.readTimeout);
    deadline.async_wait([&readDone, &timedOut, &socket](const boost::system::error_code& waitError) {
      if (!waitError && !readDone) {
        timedOut = true;
        boost::system::error_code ignored;
        socket.cancel(ignored);
      }
    });
  }
  beast::http::async_read(socket, buffer, parser, [&ec, &readDone, &deadline](const beast::error_code& readError, std::size_t) {
    readDone = true;
    ec = readError;
    deadline.cancel();
  });
  ioContext.run();
  ioContext.restart();
  return timedOut;
}

void ServeConnection(asio::io_context& ioContext, tcp::socket& socket, const Connection& cnx) {
  beast::flat_buffer buffer;
  beast::http::request_parser<beast::http::string_body> parser;
  parser.header_limit(static_cast<std::uint32_t>(cnx.maxHeaderBytes));
  parser.body_limit(static_cast<std::uint64_t>(cnx.maxBodyBytes));

  beast::error_code ec;
  if (ReadRequest(ioContext, socket, buffer, parser, cnx, ec)) {
    cnx.logger->warn("Request from {}:{} not received within {} ms", cnx.remoteEndpoint.address().to_string(),
                     cnx.remoteEndpoint.port(), cnx.readTimeout.count());
    WriteErrorAndClose(socket, beast::http::status::request_timeout,
                       parser.is_header_done() ? parser.get().version() : 11U, false, cnx);
    return;
  }
  if (ec == beast::http::error::end_of_stream) {
    log::debug("Connection from {}:{} closed before sending a request", cnx.remoteEndpoint.address().to_string(),
               cnx.remoteEndpoint.port());
    socket.close(ec);
    return;
  }
  if (ec) {
    if (IsWireError(ec)) {
      RejectRequest(socket, ec, parser.is_header_done() ? parser.get().version() : 11U, cnx);
    } else {
      log::debug("Read error on connection from {}:{}: {}", cnx.remoteEndpoint.address().to_string(),
                 cnx.remoteEndpoint.port(), ec.message());
      socket.close(ec);
    }
    return;
  }

  const unsigned version = parser.get().version();
  const bool headOnly = parser.get().method() == beast::http::verb::head;

  BeastResponseSink sink;
  try {
    cnx.callback(RawRequest{parser.release(), cnx.remoteEndpoint}, sink);
  } catch (const std::exception& ex) {
    cnx.logger->error("Exception while serving request from {}:{}: {}", cnx.remoteEndpoint.address().to_string(),
                      cnx.remoteEndpoint.port(), ex.what());
  }

  if (!sink.ended()) {
    cnx.logger->error("Response to {}:{} was not completed, answering with status 500",
                      cnx.remoteEndpoint.address().to_string(), cnx.remoteEndpoint.port());
    WriteErrorAndClose(socket, beast::http::status::internal_server_error, version, headOnly, cnx);
    return;
  }

  BeastResponseSink::Message response = std::move(sink).release();
  response.version(version);
  WriteAndClose(socket, response, headOnly, cnx);
}

}  // namespace

TcpTransport::TcpTransport(ServerConfig config, RequestCallback callback, Logger logger)
    : _config(std::move(config)), _callback(std::move(callback)), _logger(std::move(logger)), _acceptor(_ioContext) {
  _config.validate();

  boost::system::error_code ec;
  const tcp::endpoint endpoint(asio::ip::make_address(_config.ipAddress), _config.port);

  _acceptor.open(endpoint.protocol(), ec);
  if (ec) {
    ThrowSystemError(ec, "Unable to create listening socket for {}", _config.ipAddress);
  }
  if (_config.reuseAddress) {
    _acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
      ThrowSystemError(ec, "Unable to set SO_REUSEADDR");
    }
  }
  _acceptor.bind(endpoint, ec);
  if (ec) {
    ThrowSystemError(ec, "Unable to bind {}:{}", _config.ipAddress, _config.port);
  }
  _acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    ThrowSystemError(ec, "Unable to listen on {}:{}", _config.ipAddress, _config.port);
  }
  _port = _acceptor.local_endpoint().port();
  log::debug("Listening socket bound to {}:{}", _config.ipAddress, _port);
}

TcpTransport::~TcpTransport() {
  boost::system::error_code ec;
  _acceptor.close(ec);
}

void TcpTransport::run() {
  runUntil([] { return false; });
}

void TcpTransport::runUntil(const std::function<bool()>& predicate) {
  _logger->info("Server running on {}:{}", _config.ipAddress, _port);

  startAccept();
  while (!_stopRequested.load(std::memory_order_acquire) && !SignalHandler::IsStopRequested() && !predicate()) {
    _ioContext.run_for(std::chrono::duration_cast<std::chrono::steady_clock::duration>(_config.pollInterval));
    if (_ioContext.stopped()) {
      _ioContext.restart();
    }
  }

  // Cancel the pending accept and flush its completion handler so that the loop can be started again.
  boost::system::error_code ec;
  _acceptor.cancel(ec);
  _ioContext.restart();
  _ioContext.poll();
  _ioContext.restart();

  _stopRequested.store(false, std::memory_order_release);
  if (SignalHandler::IsStopRequested()) {
    _logger->info("Server stopped on signal {}", SignalHandler::ReceivedSignal());
  } else {
    _logger->info("Server stopped");
  }
}

void TcpTransport::stop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _ioContext.stop();
}

void TcpTransport::startAccept() {
  _acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      _logger->warn("Accept failed: {}", ec.message());
    } else {
      spawnConnection(std::move(socket));
    }
    startAccept();
  });
}

void TcpTransport::spawnConnection(tcp::socket socket) {
  boost::system::error_code ec;
  Connection cnx{socket.remote_endpoint(ec), _callback, _logger, _config.maxHeaderBytes, _config.maxBodyBytes,
                 _config.readTimeout};
  if (ec) {
    // peer already gone
    log::debug("Dropping accepted connection: {}", ec.message());
    return;
  }
  if (_config.tcpNoDelay) {
    socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
      _logger->warn("Unable to set TCP_NODELAY: {}", ec.message());
    }
  }
  log::debug("Accepted connection from {}:{}", cnx.remoteEndpoint.address().to_string(), cnx.remoteEndpoint.port());

  // The native socket is handed over to the connection thread which re-wraps it in its own io_context, so that
  // the connection does not depend on the lifetime of this transport.
  const auto protocol = cnx.remoteEndpoint.protocol();
  const auto nativeHandle = socket.release(ec);
  if (ec) {
    _logger->error("Unable to release accepted socket: {}", ec.message());
    return;
  }

  std::thread([cnx = std::move(cnx), protocol, nativeHandle]() {
    asio::io_context ioContext;
    try {
      tcp::socket connectionSocket(ioContext, protocol, nativeHandle);
      ServeConnection(ioContext, connectionSocket, cnx);
    } catch (const std::exception& ex) {
      cnx.logger->error("Exception while serving connection from {}:{}: {}", cnx.remoteEndpoint.address().to_string(),
                        cnx.remoteEndpoint.port(), ex.what());
    } catch (...) {
      cnx.logger->error("Unknown exception while serving connection from {}:{}",
                        cnx.remoteEndpoint.address().to_string(), cnx.remoteEndpoint.port());
    }
  }).detach();
}

}  // namespace anvil
