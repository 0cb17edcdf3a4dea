#include "anvil/http-response.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "anvil/http-constants.hpp"
#include "anvil/http-header.hpp"
#include "anvil/http-status-code.hpp"

namespace anvil {

namespace {

void ValidateHeader(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument(fmt::format("HTTP header name is invalid: '{}'", name));
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument(fmt::format("HTTP header value is invalid for '{}'", name));
  }
}

}  // namespace

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) {
  setStatusCode(code);
  setReason(reason);
}

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) {
  setBody(std::string(body), contentType);
}

void HttpResponse::setStatusCode(http::StatusCode statusCode) {
  if (!http::IsValidStatusCode(statusCode)) {
    throw std::invalid_argument(fmt::format("Invalid HTTP status code {}", statusCode));
  }
  _statusCode = statusCode;
}

void HttpResponse::setReason(std::string_view reason) {
  if (!http::IsValidHeaderValue(reason)) {
    throw std::invalid_argument("HTTP reason phrase is invalid");
  }
  _reason.assign(reason);
}

void HttpResponse::setHeader(std::string_view name, std::string_view value) {
  ValidateHeader(name, value);
  _headers.set(name, value);
}

void HttpResponse::appendHeader(std::string_view name, std::string_view value) {
  ValidateHeader(name, value);
  _headers.append(name, value);
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  if (!contentType.empty()) {
    setHeader(http::ContentType, contentType);
  }
}

}  // namespace anvil
