#pragma once

#include "anvil/http-response.hpp"
#include "anvil/log.hpp"
#include "anvil/raw-response-sink.hpp"

namespace anvil {

// Writes 'response' to 'sink': status line, headers in order, body, then ends the response.
// Failures reported by the sink are logged with 'logger' and swallowed: no second response is ever attempted.
void WriteBack(HttpResponse&& response, RawResponseSink& sink, log::logger& logger) noexcept;

// The response sent whenever a request cannot be served: 500, no extra header, body "Internal Server Error".
[[nodiscard]] HttpResponse InternalServerErrorResponse();

}  // namespace anvil
