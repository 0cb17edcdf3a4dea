#include "anvil/response-adapter.hpp"

#include <exception>
#include <string>

#include "anvil/http-constants.hpp"
#include "anvil/http-response.hpp"
#include "anvil/http-status-code.hpp"
#include "anvil/log.hpp"
#include "anvil/raw-response-sink.hpp"

namespace anvil {

void WriteBack(HttpResponse&& response, RawResponseSink& sink, log::logger& logger) noexcept {
  try {
    sink.status(response.status(), response.reason());
    for (const auto& field : response.headers()) {
      sink.header(field.name, field.value);
    }
    if (!response.body().empty()) {
      sink.write(response.body());
    }
    sink.end();
  } catch (const std::exception& ex) {
    logger.error("Error writing response: {}", ex.what());
  } catch (...) {
    logger.error("Unknown error writing response");
  }
}

HttpResponse InternalServerErrorResponse() {
  return HttpResponse(http::StatusCodeInternalServerError).body(std::string(http::ReasonInternalServerError), {});
}

}  // namespace anvil
