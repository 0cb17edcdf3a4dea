#include <gtest/gtest.h>

#include <atomic>
#include <expected>
#include <stdexcept>
#include <string>

#include "anvil/handler-error.hpp"
#include "anvil/handler.hpp"
#include "anvil/http-constants.hpp"
#include "anvil/http-request.hpp"
#include "anvil/http-response.hpp"
#include "anvil/http-status-code.hpp"
#include "anvil/server-config.hpp"
#include "anvil/test_server_fixture.hpp"
#include "anvil/test_util.hpp"

using namespace anvil;

namespace {

std::atomic<int> gNbHandlerCalls{0};

// Routes on the path to exercise every outcome of an exchange.
HandlerResult Dispatch(HttpRequest& request) {
  ++gNbHandlerCalls;
  if (request.path() == "/fail") {
    return std::unexpected(HandlerError("refusing {}", request.path()));
  }
  if (request.path() == "/throw") {
    throw std::runtime_error("handler exploded");
  }
  if (request.path() == "/teapot") {
    return HttpResponse(http::StatusCodeImATeapot, "I'm a teapot").header("X-Brew", "earl grey").body("short and stout");
  }
  if (request.path() == "/no-content") {
    return HttpResponse(http::StatusCodeNoContent).header("X-Deleted", "yes");
  }
  if (request.path() == "/no-content-with-body") {
    return HttpResponse(http::StatusCodeNoContent).body("should not be there");
  }
  if (request.path() == "/not-modified") {
    return HttpResponse(http::StatusCodeNotModified).header("ETag", "\"v1\"");
  }
  if (request.path() == "/not-modified-with-body") {
    return HttpResponse(http::StatusCodeNotModified).body("stale");
  }
  if (request.path() == "/continue") {
    return HttpResponse(100);
  }
  HttpResponse response;
  response.body(std::string(request.body().empty() ? request.path() : request.body()));
  if (auto name = request.queryParamValue("name")) {
    response.header("X-Name", *name);
  }
  return response;
}

class HttpDispatchTest : public ::testing::Test {
 protected:
  void SetUp() override { gNbHandlerCalls.store(0); }

  test::TestServer ts{Dispatch};
};

}  // namespace

TEST_F(HttpDispatchTest, SuccessReturnsHandlerResponse) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/hello?name=J%C3%BCrgen"});
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "/hello");
  EXPECT_EQ(response.headerValue("X-Name"), "J\xC3\xBCrgen");
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeTextPlain);
  EXPECT_EQ(response.headerValue(http::Connection), http::close);
  EXPECT_EQ(gNbHandlerCalls.load(), 1);
}

TEST_F(HttpDispatchTest, RequestBodyReachesHandler) {
  auto response = test::Request(ts.port(), test::RequestOptions{.method = "POST", .target = "/echo", .body = "data!"});
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "data!");
}

TEST_F(HttpDispatchTest, CustomStatusReasonAndHeaders) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/teapot"});
  EXPECT_EQ(response.statusCode, http::StatusCodeImATeapot);
  EXPECT_EQ(response.reason, "I'm a teapot");
  EXPECT_EQ(response.headerValue("X-Brew"), "earl grey");
  EXPECT_EQ(response.body, "short and stout");
}

TEST_F(HttpDispatchTest, NoContentIsSentWithoutBodyNorLength) {
  auto raw = test::SendAndCollect(ts.port(), test::BuildRequest(test::RequestOptions{.target = "/no-content"}));
  auto response = test::ParseResponseOrThrow(raw);
  EXPECT_EQ(response.statusCode, http::StatusCodeNoContent);
  EXPECT_EQ(response.headerValue("X-Deleted"), "yes");
  EXPECT_FALSE(response.headerValue("Content-Length").has_value());
  EXPECT_FALSE(response.headerValue("Transfer-Encoding").has_value());
  EXPECT_TRUE(response.body.empty());
  EXPECT_EQ(test::CountOccurrences(raw, "HTTP/1.1 "), 1U);
}

TEST_F(HttpDispatchTest, NotModifiedIsSentWithoutBody) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/not-modified"});
  EXPECT_EQ(response.statusCode, http::StatusCodeNotModified);
  EXPECT_EQ(response.headerValue("ETag"), "\"v1\"");
  EXPECT_TRUE(response.body.empty());
}

TEST_F(HttpDispatchTest, BodyOnBodilessStatusGives500) {
  for (const char* target : {"/no-content-with-body", "/not-modified-with-body"}) {
    auto raw = test::SendAndCollect(ts.port(), test::BuildRequest(test::RequestOptions{.target = target}));
    ASSERT_FALSE(raw.empty()) << target;
    auto response = test::ParseResponseOrThrow(raw);
    EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError) << target;
    EXPECT_EQ(response.body, "Internal Server Error") << target;
    EXPECT_EQ(test::CountOccurrences(raw, "HTTP/1.1 "), 1U) << target;
  }
}

TEST_F(HttpDispatchTest, InformationalFinalResponseGives500) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/continue"});
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
}

TEST_F(HttpDispatchTest, HeadResponseCarriesLengthButNoBody) {
  auto response = test::Request(ts.port(), test::RequestOptions{.method = "HEAD", .target = "/hello"});
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.headerValue("Content-Length"), "6");
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeTextPlain);
  EXPECT_TRUE(response.body.empty());
  EXPECT_EQ(gNbHandlerCalls.load(), 1);
}

TEST_F(HttpDispatchTest, HandlerErrorGives500) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/fail"});
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body, "Internal Server Error");
  EXPECT_FALSE(response.headerValue("X-Brew").has_value());
}

TEST_F(HttpDispatchTest, HandlerExceptionGives500) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/throw"});
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body, "Internal Server Error");

  // the server is still serving
  EXPECT_EQ(test::Request(ts.port()).statusCode, http::StatusCodeOK);
}

TEST_F(HttpDispatchTest, UnsupportedMethodGives500WithoutCallingHandler) {
  auto raw = test::SendAndCollect(ts.port(), "BREW /pot HTTP/1.1\r\nHost: localhost\r\n\r\n");
  auto response = test::ParseResponseOrThrow(raw);
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body, "Internal Server Error");
  EXPECT_EQ(test::CountOccurrences(raw, "HTTP/1.1 "), 1U);
  EXPECT_EQ(gNbHandlerCalls.load(), 0);
}

TEST_F(HttpDispatchTest, MissingHostGives500WithoutCallingHandler) {
  auto response = test::Request(ts.port(), test::RequestOptions{.host = ""});
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(gNbHandlerCalls.load(), 0);
}

TEST_F(HttpDispatchTest, MalformedPercentEncodingGives500) {
  auto response = test::Request(ts.port(), test::RequestOptions{.target = "/bad%zz"});
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(gNbHandlerCalls.load(), 0);
}

TEST_F(HttpDispatchTest, Http10RequestWithoutHost) {
  auto raw = test::SendAndCollect(ts.port(), "GET /legacy HTTP/1.0\r\n\r\n");
  auto response = test::ParseResponseOrThrow(raw);
  EXPECT_TRUE(raw.starts_with("HTTP/1.0 200"));
  EXPECT_EQ(response.body, "/legacy");
}

TEST_F(HttpDispatchTest, GarbageIsRejectedByTransport) {
  auto response = test::ParseResponseOrThrow(test::SendAndCollect(ts.port(), "\x01\x02\x03 garbage\r\n\r\n"));
  EXPECT_EQ(response.statusCode, http::StatusCodeBadRequest);
  EXPECT_EQ(gNbHandlerCalls.load(), 0);
}

TEST_F(HttpDispatchTest, ExactlyOneResponsePerConnection) {
  // a pipelined second request on the same connection is not served
  test::RequestOptions opt;
  const std::string twoRequests = test::BuildRequest(opt) + test::BuildRequest(opt);
  auto raw = test::SendAndCollect(ts.port(), twoRequests);
  EXPECT_EQ(test::CountOccurrences(raw, "HTTP/1.1 "), 1U);
  EXPECT_EQ(gNbHandlerCalls.load(), 1);
}

TEST(HttpDispatchAbsoluteFormTest, HostComesFromTarget) {
  test::TestServer ts([](HttpRequest& request) { return HttpResponse(request.host()); });
  auto response =
      test::Request(ts.port(), test::RequestOptions{.target = "http://example.org:8080/x", .host = "localhost"});
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "example.org:8080");
}
