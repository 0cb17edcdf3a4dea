#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "anvil/http-headers.hpp"
#include "anvil/http-method.hpp"
#include "anvil/http-version.hpp"
#include "anvil/url-decode.hpp"

namespace anvil {

// Protocol-agnostic representation of an inbound HTTP request.
// Built fresh for each exchange by the request adapter (see AdaptRequest) and owned by that exchange only: a handler
// receives it by mutable reference and must not keep references into it after returning.
class HttpRequest {
 public:
  struct RemoteAddress {
    std::string ip;
    uint16_t port{};

    bool operator==(const RemoteAddress&) const noexcept = default;
  };

  using Attributes = std::map<std::string, std::string, std::less<>>;

  // Default constructed request is 'GET / HTTP/1.1' without headers nor body.
  HttpRequest() = default;

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  HttpRequest& method(http::Method method) & noexcept {
    _method = method;
    return *this;
  }

  // The request target as received (origin-form, absolute-form or '*').
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  HttpRequest& target(std::string target) & {
    _target = std::move(target);
    return *this;
  }

  // The URL decoded path (the target without the query string). It cannot be empty.
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  //  GET /path%2Caaa?key=val -> '/path,aaa'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  HttpRequest& path(std::string path) & {
    _path = std::move(path);
    return *this;
  }

  // The raw (not decoded) query string, without the leading '?'. Empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  HttpRequest& query(std::string query) & {
    _query = std::move(query);
    return *this;
  }

  // Decoded query parameters, in order, duplicates preserved (application/x-www-form-urlencoded rules).
  // Decoding happens on each call.
  [[nodiscard]] std::vector<url::QueryParam> queryParams() const { return url::DecodeQueryParams(_query); }

  // Decoded value of the first query parameter with given key, std::nullopt if absent.
  [[nodiscard]] std::optional<std::string> queryParamValue(std::string_view key) const;

  // Host the request was addressed to (Host header or authority of an absolute-form target). May be empty for
  // HTTP/1.0 requests.
  [[nodiscard]] std::string_view host() const noexcept { return _host; }

  HttpRequest& host(std::string host) & {
    _host = std::move(host);
    return *this;
  }

  // Get the HTTP version of the request.
  [[nodiscard]] http::Version version() const noexcept { return _version; }

  HttpRequest& version(http::Version version) & noexcept {
    _version = version;
    return *this;
  }

  // Request headers, in order of reception. Lookups are case-insensitive.
  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _headers; }
  [[nodiscard]] HttpHeaders& headers() noexcept { return _headers; }

  // Value of the first header with given name, std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.value(name);
  }

  // Value of the first header with given name, empty if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _headers.valueOrEmpty(name);
  }

  // The fully received body of the request.
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpRequest& body(std::string body) & {
    _body = std::move(body);
    return *this;
  }

  [[nodiscard]] const RemoteAddress& remoteAddress() const noexcept { return _remoteAddress; }

  HttpRequest& remoteAddress(RemoteAddress remoteAddress) & {
    _remoteAddress = std::move(remoteAddress);
    return *this;
  }

  // Per-request key / value annotations, free for handlers to use while they process the request.
  [[nodiscard]] std::optional<std::string_view> attribute(std::string_view key) const;

  HttpRequest& attribute(std::string_view key, std::string_view value) &;

  [[nodiscard]] const Attributes& attributes() const noexcept { return _attributes; }

 private:
  http::Method _method{http::Method::GET};
  http::Version _version{http::HTTP_1_1};
  std::string _target{"/"};
  std::string _path{"/"};
  std::string _query;
  std::string _host;
  HttpHeaders _headers;
  std::string _body;
  RemoteAddress _remoteAddress;
  Attributes _attributes;
};

}  // namespace anvil

// Human readable, multi-line rendering of a request, used when logging failed exchanges.
template <>
struct fmt::formatter<anvil::HttpRequest> {
  constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const anvil::HttpRequest& request, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "Request {{\n    method: {}\n    target: {}\n    version: {}\n    host: {}\n"
                          "    remote_addr: {}:{}\n    headers: {}\n    body: {} bytes\n}}",
                          anvil::http::MethodToStr(request.method()), request.target(), request.version().str(),
                          request.host(), request.remoteAddress().ip, request.remoteAddress().port,
                          request.headers().size(), request.body().size());
  }
};
