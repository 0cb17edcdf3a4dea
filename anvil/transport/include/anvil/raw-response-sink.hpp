#pragma once

#include <string_view>

#include "anvil/http-status-code.hpp"

namespace anvil {

// Write side of one exchange, as exposed by the transport to the dispatch callback.
// Expected call sequence: status, zero or more header, zero or more write, then exactly one end.
// Implementations report misuse and invalid input with exceptions.
class RawResponseSink {
 public:
  virtual ~RawResponseSink() = default;

  // Sets the status line. An empty reason lets the transport pick the standard phrase.
  virtual void status(http::StatusCode statusCode, std::string_view reason) = 0;

  // Appends a header field line.
  virtual void header(std::string_view name, std::string_view value) = 0;

  // Appends body bytes.
  virtual void write(std::string_view data) = 0;

  // Completes the response. Nothing can be written afterwards.
  virtual void end() = 0;
};

}  // namespace anvil
