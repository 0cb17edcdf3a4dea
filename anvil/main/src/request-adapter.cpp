#include "anvil/request-adapter.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "anvil/beast-string-view.hpp"
#include "anvil/http-constants.hpp"
#include "anvil/http-header.hpp"
#include "anvil/http-method.hpp"
#include "anvil/http-request.hpp"
#include "anvil/http-version.hpp"
#include "anvil/raw-request.hpp"
#include "anvil/string-equal-ignore-case.hpp"
#include "anvil/string-trim.hpp"
#include "anvil/url-decode.hpp"

namespace anvil {

namespace {

using Kind = AdaptationError::Kind;

std::unexpected<AdaptationError> Fail(Kind kind, std::string message) {
  return std::unexpected(AdaptationError{kind, std::move(message)});
}

constexpr bool IsTargetChar(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return uch > 0x20 && uch != 0x7F;
}

constexpr std::string_view kHttpScheme = "http://";
constexpr std::string_view kHttpsScheme = "https://";

struct SplitTarget {
  std::string_view authority;
  std::string_view path;
  std::string_view query;
};

// Splits an origin-form or absolute-form target. Returns std::nullopt if the form is not recognized.
std::optional<SplitTarget> Split(std::string_view target) {
  SplitTarget split;
  if (!target.starts_with('/')) {
    std::size_t schemeLen;
    if (StartsWithCaseInsensitive(target, kHttpScheme)) {
      schemeLen = kHttpScheme.size();
    } else if (StartsWithCaseInsensitive(target, kHttpsScheme)) {
      schemeLen = kHttpsScheme.size();
    } else {
      return std::nullopt;
    }
    target.remove_prefix(schemeLen);
    const auto authorityEnd = std::min(target.find('/'), target.find('?'));
    split.authority = target.substr(0, authorityEnd);
    if (split.authority.empty()) {
      return std::nullopt;
    }
    target = authorityEnd == std::string_view::npos ? std::string_view{} : target.substr(authorityEnd);
  }

  const auto queryPos = target.find('?');
  split.path = target.substr(0, queryPos);
  if (queryPos != std::string_view::npos) {
    split.query = target.substr(queryPos + 1);
  }
  if (split.path.empty()) {
    // 'http://host' and 'http://host?q' designate the root
    split.path = "/";
  }
  return split;
}

}  // namespace

std::string_view AdaptationErrorKindToStr(AdaptationError::Kind kind) {
  switch (kind) {
    case Kind::UnsupportedMethod:
      return "unsupported method";
    case Kind::UnsupportedVersion:
      return "unsupported version";
    case Kind::InvalidTarget:
      return "invalid target";
    case Kind::InvalidHeader:
      return "invalid header";
    case Kind::MissingHost:
      return "missing host";
    default:
      return "unknown";
  }
}

std::expected<HttpRequest, AdaptationError> AdaptRequest(RawRequest&& rawRequest) {
  RawRequest::Message& message = rawRequest.message;

  HttpRequest request;

  // Method
  const std::string_view methodStr = ToStdStringView(message.method_string());
  const auto optMethod = http::MethodStrToOptEnum(methodStr);
  if (!optMethod) {
    return Fail(Kind::UnsupportedMethod, fmt::format("'{}' is not a supported HTTP method", methodStr));
  }
  request.method(*optMethod);

  // Version
  const http::Version version = http::Version::FromCompact(message.version());
  if (version != http::HTTP_1_0 && version != http::HTTP_1_1) {
    return Fail(Kind::UnsupportedVersion, fmt::format("HTTP/{}.{} is not supported", version.major, version.minor));
  }
  request.version(version);

  // Target
  const std::string_view target = ToStdStringView(message.target());
  if (target.empty()) {
    return Fail(Kind::InvalidTarget, "empty request target");
  }
  if (!std::ranges::all_of(target, IsTargetChar)) {
    return Fail(Kind::InvalidTarget, "request target contains whitespace or control characters");
  }
  std::string authority;
  if (target == "*") {
    if (*optMethod != http::Method::OPTIONS) {
      return Fail(Kind::InvalidTarget, fmt::format("asterisk-form target is only allowed for OPTIONS, not {}",
                                                   http::MethodToStr(*optMethod)));
    }
    request.path("*");
  } else {
    const auto split = Split(target);
    if (!split) {
      return Fail(Kind::InvalidTarget, fmt::format("'{}' is neither in origin-form nor in absolute-form", target));
    }
    auto path = url::DecodePath(split->path);
    if (!path) {
      return Fail(Kind::InvalidTarget, fmt::format("malformed percent-encoding in path '{}'", split->path));
    }
    request.path(std::move(*path));
    request.query(std::string(split->query));
    authority.assign(split->authority);
  }
  request.target(std::string(target));

  // Headers
  HttpHeaders& headers = request.headers();
  for (const auto& field : message) {
    const std::string_view name = ToStdStringView(field.name_string());
    const std::string_view value = ToStdStringView(field.value());
    if (!http::IsValidHeaderName(name)) {
      return Fail(Kind::InvalidHeader, fmt::format("'{}' is not a valid header name", name));
    }
    if (!http::IsValidHeaderValue(value)) {
      return Fail(Kind::InvalidHeader, fmt::format("value of header '{}' contains control characters", name));
    }
    headers.append(name, value);
  }

  // Host. RFC 7230 §5.4: the authority of an absolute-form target takes precedence over the Host header.
  const auto hostHeader = headers.value(http::Host);
  if (!hostHeader && version == http::HTTP_1_1) {
    return Fail(Kind::MissingHost, "HTTP/1.1 request without Host header");
  }
  if (!authority.empty()) {
    request.host(std::move(authority));
  } else if (hostHeader) {
    request.host(std::string(TrimOws(*hostHeader)));
  }

  request.body(std::move(message.body()));

  const auto& endpoint = rawRequest.remoteEndpoint;
  request.remoteAddress({endpoint.address().to_string(), endpoint.port()});

  return request;
}

}  // namespace anvil
