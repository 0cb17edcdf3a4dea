#pragma once

#include <algorithm>
#include <string>
#include <string_view>

#include "anvil/tchars.hpp"

namespace anvil::http {

struct HeaderField {
  std::string name;
  std::string value;

  bool operator==(const HeaderField&) const noexcept = default;
};

// RFC 7230 §3.2: Header field values can be preceded and followed by optional whitespace (OWS).
// OWS is defined as zero or more spaces (SP) or horizontal tabs (HTAB).
constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return is_tchar(ch); });
}

// Validates that a header value does not contain CR or LF characters. HTAB and visible ASCII characters are allowed,
// as well as obs-text (bytes >= 0x80). The empty value is allowed.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](char ch) {
    const auto uch = static_cast<unsigned char>(ch);
    return uch == '\t' || uch >= 0x80 || (uch >= 0x20 && uch != 0x7F);
  });
}

}  // namespace anvil::http
