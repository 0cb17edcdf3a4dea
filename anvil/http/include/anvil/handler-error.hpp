#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace anvil {

// Failure explicitly reported by a Handler while processing an otherwise well-formed request.
// It is logged by the dispatch core together with the failing request and answered with a 500 response; its
// content is never sent to the client.
class HandlerError {
 public:
  explicit HandlerError(std::string message) : _message(std::move(message)) {}

  template <typename... Args>
  explicit HandlerError(fmt::format_string<Args...> fmt, Args&&... args)
      : _message(fmt::format(fmt, std::forward<Args>(args)...)) {}

  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  bool operator==(const HandlerError&) const noexcept = default;

 private:
  std::string _message;
};

}  // namespace anvil

template <>
struct fmt::formatter<anvil::HandlerError> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const anvil::HandlerError& error, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(error.message(), ctx);
  }
};
