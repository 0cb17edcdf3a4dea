#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anvil::url {

// Strictly decodes a percent-encoded path. '+' is kept as is.
// Returns std::nullopt if an escape is truncated or not made of two hex digits.
[[nodiscard]] std::optional<std::string> DecodePath(std::string_view encodedPath);

// Lenient decoding of one query string key or value: '+' becomes a space and malformed escapes are kept verbatim.
[[nodiscard]] std::string DecodeQueryComponent(std::string_view component);

using QueryParam = std::pair<std::string, std::string>;

// Best effort decoding of a raw query string with application/x-www-form-urlencoded semantics:
//  - pairs are separated by '&', key and value by the first '='
//  - missing '=' gives an empty value, empty pairs are skipped
//  - keys and values are decoded with DecodeQueryComponent
// Order and duplicates are preserved.
[[nodiscard]] std::vector<QueryParam> DecodeQueryParams(std::string_view query);

}  // namespace anvil::url
