#include "anvil/server-config.hpp"

#include <fmt/format.h>

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace anvil {

ServerConfig& ServerConfig::withIpAddress(std::string_view ipAddress) {
  this->ipAddress.assign(ipAddress);
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withReuseAddress(bool on) {
  this->reuseAddress = on;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withReadTimeout(std::chrono::milliseconds readTimeout) {
  this->readTimeout = readTimeout;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

void ServerConfig::validate() const {
  boost::system::error_code ec;
  boost::asio::ip::make_address(ipAddress, ec);
  if (ec) {
    throw std::invalid_argument(fmt::format("invalid IP address '{}': {}", ipAddress, ec.message()));
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (readTimeout.count() < 0) {
    throw std::invalid_argument("readTimeout must be >= 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
}

}  // namespace anvil
