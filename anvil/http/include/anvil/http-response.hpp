#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "anvil/http-constants.hpp"
#include "anvil/http-headers.hpp"
#include "anvil/http-status-code.hpp"

namespace anvil {

// Internal representation of an outbound HTTP response: status code, optional reason phrase, ordered headers and
// body. It is written back as is by the response adapter: anvil never adds, removes or reorders user headers.
// Framing headers (Content-Length, Connection) are the transport's business and should not be set here.
//
// All setters come in lvalue and rvalue flavors so that responses can be built fluently:
//   return HttpResponse(http::StatusCodeCreated).header("X-Id", "42").body("created");
class HttpResponse {
 public:
  // Constructs an empty response with given status code (200 by default) and optional reason phrase.
  // Throws std::invalid_argument if the status code is not a 3 digits integer.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Constructs a 200 response with given body and Content-Type.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  // Replaces the status code. Must be a 3 digits integer, throws std::invalid_argument otherwise.
  HttpResponse& status(http::StatusCode statusCode) & {
    setStatusCode(statusCode);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && {
    setStatusCode(statusCode);
    return std::move(*this);
  }

  // Reason phrase. If empty, the transport emits the standard one for the status code.
  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  HttpResponse& reason(std::string_view reason) & {
    setReason(reason);
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    setReason(reason);
    return std::move(*this);
  }

  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _headers; }

  // Value of the first header with given name, std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.value(name);
  }

  // Set or replace a header ensuring at most one instance (case-insensitive name comparison).
  // Throws std::invalid_argument if the name is not a valid token or the value contains CR / LF.
  HttpResponse& header(std::string_view name, std::string_view value) & {
    setHeader(name, value);
    return *this;
  }

  HttpResponse&& header(std::string_view name, std::string_view value) && {
    setHeader(name, value);
    return std::move(*this);
  }

  // Append a header line (duplicates allowed, for instance several Set-Cookie).
  // Throws std::invalid_argument if the name is not a valid token or the value contains CR / LF.
  HttpResponse& addHeader(std::string_view name, std::string_view value) & {
    appendHeader(name, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view name, std::string_view value) && {
    appendHeader(name, value);
    return std::move(*this);
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Replaces the body. The Content-Type header is set to 'contentType' unless it is empty.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  // Appends to the body without touching the headers.
  HttpResponse& appendBody(std::string_view data) & {
    _body.append(data);
    return *this;
  }

  HttpResponse&& appendBody(std::string_view data) && {
    _body.append(data);
    return std::move(*this);
  }

 private:
  void setStatusCode(http::StatusCode statusCode);

  void setReason(std::string_view reason);

  void setHeader(std::string_view name, std::string_view value);

  void appendHeader(std::string_view name, std::string_view value);

  void setBody(std::string body, std::string_view contentType);

  http::StatusCode _statusCode{http::StatusCodeOK};
  std::string _reason;
  HttpHeaders _headers;
  std::string _body;
};

}  // namespace anvil
