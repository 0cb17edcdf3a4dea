#pragma once

#include <string_view>

namespace anvil::http {

// HTTP header field names are case-insensitive per RFC 7230. They are stored here in their conventional
// canonical form; comparisons must use CaseInsensitiveEqual.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Host = "Host";

inline constexpr std::string_view close = "close";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                                    // 400
inline constexpr std::string_view ReasonRequestTimeout = "Request Timeout";                            // 408
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";                         // 413
inline constexpr std::string_view ReasonRequestHeaderFieldsTooLarge = "Request Header Fields Too Large";  // 431
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";                 // 500

}  // namespace anvil::http
