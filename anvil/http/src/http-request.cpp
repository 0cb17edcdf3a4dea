#include "anvil/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "anvil/url-decode.hpp"

namespace anvil {

std::optional<std::string> HttpRequest::queryParamValue(std::string_view key) const {
  for (auto& [paramKey, paramValue] : url::DecodeQueryParams(_query)) {
    if (paramKey == key) {
      return std::move(paramValue);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::attribute(std::string_view key) const {
  auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

HttpRequest& HttpRequest::attribute(std::string_view key, std::string_view value) & {
  auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    _attributes.emplace(std::string(key), std::string(value));
  } else {
    it->second.assign(value);
  }
  return *this;
}

}  // namespace anvil
