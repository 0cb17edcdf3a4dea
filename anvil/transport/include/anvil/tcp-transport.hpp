#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <functional>

#include "anvil/log.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/raw-response-sink.hpp"
#include "anvil/server-config.hpp"

namespace anvil {

// Callback invoked once per received request. It must write exactly one response into the sink and end it.
// It is copied once per accepted connection and each copy is invoked from that connection's own thread.
using RequestCallback = std::function<void(RawRequest, RawResponseSink&)>;

// Minimal HTTP/1.x transport on top of Boost.Asio / Boost.Beast.
//
// Threading model:
//  - The thread calling run() / runUntil() accepts connections.
//  - Each accepted connection is served on its own detached thread owning the socket and a copy of the callback.
//    It reads one request with Beast, calls the callback, writes the response with 'Connection: close' and closes.
//  - Wire level failures are answered here (400, 413 or 431) and never reach the callback. A request not fully
//    received within ServerConfig::readTimeout is answered 408.
//  - A callback that throws or does not end its response is answered 500.
//  - Responses to HEAD are sent without their body. 1xx, 204 and 304 responses carry no framing header.
//
// The listening socket is created, bound and listening right after construction (port() is known, even for an
// ephemeral port). It is closed on destruction. Connection threads do not reference the transport and may outlive it.
class TcpTransport {
 public:
  // Validates the config, then binds and listens.
  // Throws std::invalid_argument for an invalid config and std::system_error if the socket cannot be set up.
  TcpTransport(ServerConfig config, RequestCallback callback, Logger logger);

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport(TcpTransport&&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;
  TcpTransport& operator=(TcpTransport&&) = delete;

  ~TcpTransport();

  // The effective bound port.
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  // Accepts connections until stop() is called or a termination signal is received (see SignalHandler).
  void run();

  // Same as run(), additionally returning as soon as 'predicate' returns true. The predicate is evaluated at least
  // every pollInterval.
  void runUntil(const std::function<bool()>& predicate);

  // Requests the accept loop to return. Thread safe, may be called before run(). Connections already accepted are
  // served to completion.
  void stop() noexcept;

 private:
  void startAccept();

  void spawnConnection(boost::asio::ip::tcp::socket socket);

  ServerConfig _config;
  RequestCallback _callback;
  Logger _logger;
  boost::asio::io_context _ioContext;
  boost::asio::ip::tcp::acceptor _acceptor;
  std::atomic<bool> _stopRequested{false};
  uint16_t _port{};
};

}  // namespace anvil
