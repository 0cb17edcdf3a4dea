#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "anvil/http-header.hpp"

namespace anvil {

// Ordered collection of HTTP header fields.
//  - Insertion order is preserved, duplicates are kept as separate fields.
//  - Lookups are case-insensitive on the name (RFC 7230); the original casing is kept.
//  - No validation is performed here, callers validate names / values at their boundary.
class HttpHeaders {
 public:
  using value_type = http::HeaderField;
  using const_iterator = std::vector<http::HeaderField>::const_iterator;

  // Append a header field (duplicates allowed).
  void append(std::string_view name, std::string_view value);

  // Set or replace a header value ensuring at most one instance. The casing of the first occurrence is preserved.
  void set(std::string_view name, std::string_view value);

  // Erase all fields with given name. Returns the number of erased fields.
  std::size_t erase(std::string_view name);

  // Value of the first field with given name, std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept;

  // Value of the first field with given name, empty if absent.
  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return value(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.end(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }
  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  void clear() noexcept { _fields.clear(); }

  bool operator==(const HttpHeaders&) const noexcept = default;

 private:
  std::vector<http::HeaderField> _fields;
};

}  // namespace anvil
