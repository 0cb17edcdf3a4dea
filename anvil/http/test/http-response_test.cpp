#include "anvil/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "anvil/http-constants.hpp"
#include "anvil/http-status-code.hpp"

namespace anvil {

TEST(HttpResponseTest, DefaultIsEmpty200) {
  HttpResponse response;
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_TRUE(response.reason().empty());
  EXPECT_TRUE(response.headers().empty());
  EXPECT_TRUE(response.body().empty());
}

TEST(HttpResponseTest, StatusAndReasonConstructor) {
  HttpResponse response(http::StatusCodeNotFound, "Nope");
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.reason(), "Nope");
}

TEST(HttpResponseTest, BodyConstructorSetsContentType) {
  HttpResponse response(std::string_view("{}"), http::ContentTypeApplicationJson);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "{}");
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeApplicationJson);
}

TEST(HttpResponseTest, FluentRvalueBuilding) {
  auto response = HttpResponse(http::StatusCodeCreated)
                      .reason("Made")
                      .header("X-Id", "42")
                      .addHeader("Set-Cookie", "a=1")
                      .addHeader("Set-Cookie", "b=2")
                      .body("created");
  EXPECT_EQ(response.status(), http::StatusCodeCreated);
  EXPECT_EQ(response.reason(), "Made");
  EXPECT_EQ(response.headerValue("x-id"), "42");
  EXPECT_EQ(response.body(), "created");
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeTextPlain);
  // X-Id, Set-Cookie x2, Content-Type
  EXPECT_EQ(response.headers().size(), 4U);
}

TEST(HttpResponseTest, HeaderReplacesExisting) {
  HttpResponse response;
  response.header("X-Mode", "a");
  response.header("x-mode", "b");
  EXPECT_EQ(response.headers().size(), 1U);
  EXPECT_EQ(response.headerValue("X-Mode"), "b");
}

TEST(HttpResponseTest, BodyWithoutContentType) {
  HttpResponse response;
  response.body("raw", "");
  EXPECT_EQ(response.body(), "raw");
  EXPECT_FALSE(response.headerValue(http::ContentType).has_value());
}

TEST(HttpResponseTest, AppendBody) {
  HttpResponse response;
  response.appendBody("Hello").appendBody(", ").appendBody("World");
  EXPECT_EQ(response.body(), "Hello, World");
  EXPECT_TRUE(response.headers().empty());
}

TEST(HttpResponseTest, InvalidStatusCodeThrows) {
  EXPECT_THROW(HttpResponse(static_cast<http::StatusCode>(99)), std::invalid_argument);
  EXPECT_THROW(HttpResponse(static_cast<http::StatusCode>(1000)), std::invalid_argument);
  HttpResponse response;
  EXPECT_THROW(response.status(42), std::invalid_argument);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
}

TEST(HttpResponseTest, InvalidHeadersThrow) {
  HttpResponse response;
  EXPECT_THROW(response.header("Bad Name", "v"), std::invalid_argument);
  EXPECT_THROW(response.header("", "v"), std::invalid_argument);
  EXPECT_THROW(response.header("X-Split", "a\r\nInjected: 1"), std::invalid_argument);
  EXPECT_THROW(response.addHeader("X-Nul", std::string_view("a\0b", 3)), std::invalid_argument);
  EXPECT_TRUE(response.headers().empty());
}

TEST(HttpResponseTest, InvalidReasonThrows) {
  HttpResponse response;
  EXPECT_THROW(response.reason("OK\r\n"), std::invalid_argument);
}

TEST(HttpResponseTest, MoveKeepsContent) {
  HttpResponse response(http::StatusCodeAccepted);
  response.header("X-A", "1").body("data");
  HttpResponse moved(std::move(response));
  EXPECT_EQ(moved.status(), http::StatusCodeAccepted);
  EXPECT_EQ(moved.body(), "data");
  EXPECT_EQ(moved.headerValue("X-A"), "1");
}

}  // namespace anvil
