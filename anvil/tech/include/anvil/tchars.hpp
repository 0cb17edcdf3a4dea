#pragma once

#include <array>
#include <string_view>

namespace anvil {

namespace detail {

// RFC 7230 §3.2.6: tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
//                          / DIGIT / ALPHA
inline constexpr auto kTcharTable = [] {
  std::array<bool, 256> table{};
  for (char ch : std::string_view("!#$%&'*+-.^_`|~")) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  for (unsigned char ch = '0'; ch <= '9'; ++ch) {
    table[ch] = true;
  }
  for (unsigned char ch = 'A'; ch <= 'Z'; ++ch) {
    table[ch] = true;
    table[ch | 0x20U] = true;
  }
  return table;
}();

}  // namespace detail

constexpr bool is_tchar(char ch) noexcept { return detail::kTcharTable[static_cast<unsigned char>(ch)]; }

}  // namespace anvil
