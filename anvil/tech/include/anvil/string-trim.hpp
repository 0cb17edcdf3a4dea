#pragma once

#include <string_view>

namespace anvil {

// Removes leading and trailing optional whitespace (RFC 7230 OWS: SP and HTAB).
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  constexpr std::string_view kOws = " \t";
  const auto first = sv.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(kOws) - first + 1);
}

}  // namespace anvil
