#include "anvil/url-decode.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "anvil/char-hexadecimal-converter.hpp"

namespace anvil::url {

namespace {

enum class OnInvalidEscape : uint8_t { Reject, KeepVerbatim };

// Appends the decoded form of 'encoded' to 'out'. Returns false only when rejecting an invalid escape.
bool AppendDecoded(std::string_view encoded, char plusAs, OnInvalidEscape onInvalid, std::string& out) {
  out.reserve(out.size() + encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch == '+') {
      out.push_back(plusAs);
      continue;
    }
    if (ch != '%') {
      out.push_back(ch);
      continue;
    }
    const int high = pos + 2 < encoded.size() ? from_hex_digit(encoded[pos + 1]) : -1;
    const int low = high < 0 ? -1 : from_hex_digit(encoded[pos + 2]);
    if (low < 0) {
      if (onInvalid == OnInvalidEscape::Reject) {
        return false;
      }
      // the characters following '%' are copied by the next iterations
      out.push_back('%');
      continue;
    }
    out.push_back(static_cast<char>((high << 4) | low));
    pos += 2;
  }
  return true;
}

}  // namespace

std::optional<std::string> DecodePath(std::string_view encodedPath) {
  std::string decoded;
  if (!AppendDecoded(encodedPath, '+', OnInvalidEscape::Reject, decoded)) {
    return std::nullopt;
  }
  return decoded;
}

std::string DecodeQueryComponent(std::string_view component) {
  std::string decoded;
  AppendDecoded(component, ' ', OnInvalidEscape::KeepVerbatim, decoded);
  return decoded;
}

std::vector<QueryParam> DecodeQueryParams(std::string_view query) {
  std::vector<QueryParam> params;
  while (!query.empty()) {
    const auto pairEnd = query.find('&');
    std::string_view pair = query.substr(0, pairEnd);
    query = pairEnd == std::string_view::npos ? std::string_view{} : query.substr(pairEnd + 1);
    if (pair.empty()) {
      continue;
    }
    const auto keyEnd = pair.find('=');
    if (keyEnd == std::string_view::npos) {
      params.emplace_back(DecodeQueryComponent(pair), std::string{});
    } else {
      params.emplace_back(DecodeQueryComponent(pair.substr(0, keyEnd)), DecodeQueryComponent(pair.substr(keyEnd + 1)));
    }
  }
  return params;
}

}  // namespace anvil::url
