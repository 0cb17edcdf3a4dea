#include "anvil/http-method.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>

#include "anvil/string-equal-ignore-case.hpp"

namespace anvil::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  const auto it = std::ranges::find_if(kMethodStrings, [str](std::string_view token) {
    return CaseInsensitiveEqual(str, token);
  });
  if (it == std::end(kMethodStrings)) {
    return std::nullopt;
  }
  return MethodFromIdx(static_cast<MethodIdx>(std::distance(std::begin(kMethodStrings), it)));
}

}  // namespace anvil::http
