#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstdint>
#include <string_view>
#include <utility>

#include "anvil/http-status-code.hpp"
#include "anvil/raw-response-sink.hpp"

namespace anvil {

// RawResponseSink accumulating the response into a Beast message, serialized by the transport once the dispatch
// callback returns.
//  - status() and header() must come before the first write(). Afterwards they throw std::logic_error.
//  - Nothing is accepted after end() (std::logic_error).
//  - Invalid status codes, header names or values throw std::invalid_argument, as does body data for a status that
//    does not allow one (1xx, 204, 304).
class BeastResponseSink final : public RawResponseSink {
 public:
  using Message = boost::beast::http::response<boost::beast::http::string_body>;

  BeastResponseSink();

  void status(http::StatusCode statusCode, std::string_view reason) override;

  void header(std::string_view name, std::string_view value) override;

  void write(std::string_view data) override;

  void end() override;

  [[nodiscard]] bool ended() const noexcept { return _state == State::Ended; }

  [[nodiscard]] const Message& message() const noexcept { return _message; }

  // Gives the accumulated message away. The sink should not be used afterwards.
  [[nodiscard]] Message release() && noexcept { return std::move(_message); }

 private:
  enum class State : uint8_t { Head, Body, Ended };

  void checkNotEnded(std::string_view operation) const;

  Message _message;
  State _state{State::Head};
};

}  // namespace anvil
