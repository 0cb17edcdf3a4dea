#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace anvil {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IP address (v4 or v6) to bind. Default: all IPv4 interfaces.
  std::string ipAddress{"0.0.0.0"};
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After binding you can retrieve the
  // effective port via ListeningServer::port().
  uint16_t port{0};
  // If true, sets SO_REUSEADDR on the listening socket so that a restarted process can bind the same port while
  // previous connections are still in TIME_WAIT. Enabled by default.
  bool reuseAddress{true};
  // If true, disables Nagle's algorithm on accepted connections. Disabled by default.
  bool tcpNoDelay{false};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum allowed size (in bytes) of the aggregate HTTP request head (request line + all headers + CRLFCRLF).
  // If exceeded while parsing, the transport replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};
  // Maximum allowed size (in bytes) of a request body. Requests exceeding this limit are answered with 413 by the
  // transport, the handler is not called. Default: 1 MiB.
  std::size_t maxBodyBytes{1 << 20};
  // Maximum time allowed to receive a complete request once the connection is accepted. On expiry the transport
  // replies 408 and closes the connection. A value of 0 disables the timeout. Default: 30 s.
  std::chrono::milliseconds readTimeout{std::chrono::seconds{30}};

  // ============================
  // Serve loop
  // ============================
  // Maximum blocking interval of the accept loop when idle. It bounds the latency for noticing a stop request
  // (ListeningServer::stop(), serveUntil predicate, termination signal). Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Fluent builder style setters
  ServerConfig& withIpAddress(std::string_view ipAddress);

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withReuseAddress(bool on = true);

  ServerConfig& withTcpNoDelay(bool on = true);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ServerConfig& withReadTimeout(std::chrono::milliseconds readTimeout);

  ServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  // Validates config. Throws std::invalid_argument on the first invalid field.
  void validate() const;

  bool operator==(const ServerConfig&) const noexcept = default;
};

}  // namespace anvil
