#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "anvil/http-request.hpp"
#include "anvil/raw-request.hpp"

namespace anvil {

// Reason why a raw request could not be translated into a HttpRequest.
struct AdaptationError {
  enum class Kind : uint8_t { UnsupportedMethod, UnsupportedVersion, InvalidTarget, InvalidHeader, MissingHost };

  bool operator==(const AdaptationError&) const noexcept = default;

  Kind kind;
  std::string message;
};

std::string_view AdaptationErrorKindToStr(AdaptationError::Kind kind);

// Translates a raw transport request into the internal request representation.
// Pure function: it only consumes its argument, and either returns a fully built request or an error describing the
// first problem found. The following is checked, in order:
//  - method is one of the 9 standard ones (case-insensitive)
//  - version is HTTP/1.0 or HTTP/1.1
//  - target is in origin-form ('/path?query'), absolute-form ('http://host/path?query') or asterisk-form ('*',
//    OPTIONS only), without whitespace nor control characters, and its path is correctly percent-encoded
//  - header names are tokens, header values do not contain control characters
//  - HTTP/1.1 requests carry a Host header
[[nodiscard]] std::expected<HttpRequest, AdaptationError> AdaptRequest(RawRequest&& rawRequest);

}  // namespace anvil

template <>
struct fmt::formatter<anvil::AdaptationError> {
  constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const anvil::AdaptationError& error, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}: {}", anvil::AdaptationErrorKindToStr(error.kind), error.message);
  }
};
