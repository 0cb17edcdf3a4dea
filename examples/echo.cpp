#include <anvil/anvil.hpp>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <expected>
#include <iostream>
#include <memory>
#include <utility>

using namespace anvil;

namespace {

// Echoes the request back. '/fail' demonstrates the 500 fallback.
class EchoHandler : public Handler {
 public:
  [[nodiscard]] HandlerResult call(HttpRequest &req) const override {
    if (req.path() == "/fail") {
      return std::unexpected(HandlerError("failure requested by {}", req.remoteAddress().ip));
    }
    HttpResponse resp(http::StatusCodeOK);
    resp.appendBody("Method: ");
    resp.appendBody(http::MethodToStr(req.method()));
    resp.appendBody("\nPath: ");
    resp.appendBody(req.path());
    resp.appendBody("\nVersion: ");
    resp.appendBody(req.version().str());
    resp.appendBody("\nQuery parameters:\n");
    for (const auto &[key, value] : req.queryParams()) {
      resp.appendBody(key);
      resp.appendBody(" = ");
      resp.appendBody(value);
      resp.appendBody("\n");
    }
    resp.appendBody("Headers:\n");
    for (const auto &[name, value] : req.headers()) {
      resp.appendBody(name);
      resp.appendBody(": ");
      resp.appendBody(value);
      resp.appendBody("\n");
    }
    resp.appendBody("Body:\n");
    resp.appendBody(req.body());
    resp.header(http::ContentType, http::ContentTypeTextPlain);
    return resp;
  }
};

}  // namespace

int main(int argc, char **argv) {
  ServerConfig config;
  config.withPort(8080);
  if (argc > 1) {
    uint16_t port{};
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
    config.withPort(port);
  }
  if (argc > 2) {
    config.withIpAddress(argv[2]);
  }

  SignalHandler::Enable();
  log::set_level(log::level::debug);

  try {
    Server::Around(std::make_unique<EchoHandler>()).listen(std::move(config));
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
