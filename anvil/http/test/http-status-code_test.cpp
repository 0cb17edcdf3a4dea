#include "anvil/http-status-code.hpp"

#include <gtest/gtest.h>

namespace anvil::http {

TEST(HttpStatusCode, Validity) {
  static_assert(IsValidStatusCode(100));
  static_assert(IsValidStatusCode(999));
  static_assert(!IsValidStatusCode(99));
  static_assert(!IsValidStatusCode(1000));
}

TEST(HttpStatusCode, BodyAllowance) {
  EXPECT_TRUE(IsInformational(100));
  EXPECT_TRUE(IsInformational(199));
  EXPECT_FALSE(IsInformational(StatusCodeOK));

  EXPECT_FALSE(StatusAllowsBody(101));
  EXPECT_FALSE(StatusAllowsBody(StatusCodeNoContent));
  EXPECT_FALSE(StatusAllowsBody(StatusCodeNotModified));
  EXPECT_TRUE(StatusAllowsBody(StatusCodeOK));
  EXPECT_TRUE(StatusAllowsBody(StatusCodeFound));
  EXPECT_TRUE(StatusAllowsBody(StatusCodeInternalServerError));
}

}  // namespace anvil::http
