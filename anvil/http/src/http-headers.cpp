#include "anvil/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "anvil/string-equal-ignore-case.hpp"

namespace anvil {

void HttpHeaders::append(std::string_view name, std::string_view value) {
  _fields.push_back(http::HeaderField{std::string(name), std::string(value)});
}

void HttpHeaders::set(std::string_view name, std::string_view value) {
  auto sameName = [name](const http::HeaderField& field) { return CaseInsensitiveEqual(field.name, name); };
  auto it = std::ranges::find_if(_fields, sameName);
  if (it == _fields.end()) {
    append(name, value);
    return;
  }
  it->value.assign(value);
  _fields.erase(std::remove_if(std::next(it), _fields.end(), sameName), _fields.end());
}

std::size_t HttpHeaders::erase(std::string_view name) {
  return std::erase_if(_fields, [name](const http::HeaderField& field) { return CaseInsensitiveEqual(field.name, name); });
}

std::optional<std::string_view> HttpHeaders::value(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_fields,
                                 [name](const http::HeaderField& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace anvil
