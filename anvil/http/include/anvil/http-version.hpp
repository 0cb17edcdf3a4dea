#pragma once

#include <cstdint>
#include <string_view>

#include "anvil/http-constants.hpp"

namespace anvil::http {

// RFC 9112 §2.5 HTTP version token representation
struct Version {
  // Transport layers commonly encode versions as major * 10 + minor (11 for HTTP/1.1).
  static constexpr Version FromCompact(unsigned compact) noexcept {
    return {static_cast<uint8_t>(compact / 10U), static_cast<uint8_t>(compact % 10U)};
  }

  // "HTTP/1.0" or "HTTP/1.1", empty for other versions.
  [[nodiscard]] constexpr std::string_view str() const noexcept {
    if (major == 1 && minor == 0) {
      return HTTP10Sv;
    }
    if (major == 1 && minor == 1) {
      return HTTP11Sv;
    }
    return {};
  }

  bool operator==(const Version&) const noexcept = default;

  uint8_t major{};
  uint8_t minor{};
};

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

}  // namespace anvil::http
