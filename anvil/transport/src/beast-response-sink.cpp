#include "anvil/beast-response-sink.hpp"

#include <fmt/format.h>

#include <boost/beast/http/status.hpp>
#include <stdexcept>
#include <string_view>

#include "anvil/beast-string-view.hpp"
#include "anvil/http-header.hpp"
#include "anvil/http-status-code.hpp"

namespace anvil {

BeastResponseSink::BeastResponseSink() { _message.result(boost::beast::http::status::ok); }

void BeastResponseSink::checkNotEnded(std::string_view operation) const {
  if (_state == State::Ended) {
    throw std::logic_error(fmt::format("Cannot {} after end of response", operation));
  }
}

void BeastResponseSink::status(http::StatusCode statusCode, std::string_view reason) {
  checkNotEnded("set status");
  if (_state == State::Body) {
    throw std::logic_error("Cannot set status once body has been written");
  }
  if (!http::IsValidStatusCode(statusCode)) {
    throw std::invalid_argument(fmt::format("Invalid HTTP status code {}", statusCode));
  }
  if (!http::IsValidHeaderValue(reason)) {
    throw std::invalid_argument("Invalid HTTP reason phrase");
  }
  _message.result(static_cast<unsigned>(statusCode));
  if (!reason.empty()) {
    _message.reason(ToBeastStringView(reason));
  }
}

void BeastResponseSink::header(std::string_view name, std::string_view value) {
  checkNotEnded("add header");
  if (_state == State::Body) {
    throw std::logic_error("Cannot add header once body has been written");
  }
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument(fmt::format("Invalid HTTP header name '{}'", name));
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument(fmt::format("Invalid HTTP header value for '{}'", name));
  }
  _message.insert(ToBeastStringView(name), ToBeastStringView(value));
}

void BeastResponseSink::write(std::string_view data) {
  checkNotEnded("write");
  if (!data.empty() && !http::StatusAllowsBody(static_cast<http::StatusCode>(_message.result_int()))) {
    throw std::invalid_argument(fmt::format("Status {} does not allow a response body", _message.result_int()));
  }
  _state = State::Body;
  _message.body().append(data);
}

void BeastResponseSink::end() {
  checkNotEnded("end");
  _state = State::Ended;
}

}  // namespace anvil
