#pragma once

#include <algorithm>
#include <string_view>

namespace anvil {

// ASCII only lower casing, independent from the C locale.
constexpr char AsciiToLower(char ch) noexcept { return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch | 0x20) : ch; }

// Case-insensitive (ASCII) equality, as required for HTTP methods, header names and URI schemes.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, [](char lhsCh, char rhsCh) { return AsciiToLower(lhsCh) == AsciiToLower(rhsCh); });
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

}  // namespace anvil
