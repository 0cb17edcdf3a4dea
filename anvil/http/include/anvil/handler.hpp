#pragma once

#include <concepts>
#include <expected>
#include <memory>
#include <type_traits>
#include <utility>

#include "anvil/handler-error.hpp"
#include "anvil/http-request.hpp"
#include "anvil/http-response.hpp"

namespace anvil {

// Outcome of a handler invocation: exactly one response, or exactly one error.
using HandlerResult = std::expected<HttpResponse, HandlerError>;

// The pluggable unit of application logic served by anvil.
//
// Contract:
//   - call() may be invoked concurrently from several threads, each with its own distinct request. Implementations
//     owning mutable state must synchronize it themselves. The method is const: the dispatch core only ever holds a
//     std::shared_ptr<const Handler> to it.
//   - Each call produces exactly one HttpResponse or exactly one HandlerError. Exceptions escaping call() are
//     contained by the dispatch core and treated like a returned HandlerError.
//   - The request may be modified during the call but must not be referenced after call() returns.
class Handler {
 public:
  virtual ~Handler() = default;

  [[nodiscard]] virtual HandlerResult call(HttpRequest& request) const = 0;
};

// Callables usable as handlers: invoked with a HttpRequest&, returning a HandlerResult or anything convertible to it
// (typically a plain HttpResponse).
template <class Func>
concept HandlerFunction = std::is_invocable_r_v<HandlerResult, const Func&, HttpRequest&>;

// Adapts a callable into a Handler. The callable is invoked through a const reference, so it must be safe to call
// concurrently (a lambda with mutable captures does not qualify).
template <HandlerFunction Func>
class FunctionHandler final : public Handler {
 public:
  explicit FunctionHandler(Func func) noexcept(std::is_nothrow_move_constructible_v<Func>) : _func(std::move(func)) {}

  [[nodiscard]] HandlerResult call(HttpRequest& request) const override { return _func(request); }

 private:
  Func _func;
};

template <class Func>
  requires HandlerFunction<std::decay_t<Func>>
[[nodiscard]] std::unique_ptr<Handler> MakeHandler(Func&& func) {
  return std::make_unique<FunctionHandler<std::decay_t<Func>>>(std::forward<Func>(func));
}

}  // namespace anvil
