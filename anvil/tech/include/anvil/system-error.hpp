#pragma once

#include <fmt/core.h>

#include <string_view>
#include <system_error>
#include <utility>

namespace anvil {

// Throw std::system_error built from the given error code with a formatted message.
// Usage: ThrowSystemError(ec, "bind failed for {}:{}", address, port);
template <typename... Args>
[[noreturn]] void ThrowSystemError(std::error_code ec, fmt::format_string<Args...> fmt, Args&&... args) {
  throw std::system_error(ec, fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace anvil
