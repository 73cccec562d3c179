#include "routekit/http-response.hpp"

#include <gtest/gtest.h>

#include "routekit/http-constants.hpp"
#include "routekit/http-status-code.hpp"

namespace routekit {

TEST(HttpResponseTest, DefaultIsEmptyOk) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.reason(), "OK");
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponseTest, ConstructWithBodyAndContentType) {
  HttpResponse resp(http::StatusCodeNotFound, "Not Found", http::ContentTypeTextPlain);
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.reason(), http::ReasonNotFound);
  EXPECT_EQ(resp.body(), "Not Found");
  EXPECT_EQ(resp.headerValue("content-type"), "text/plain");
}

TEST(HttpResponseTest, HeaderReplacesAddHeaderAppends) {
  HttpResponse resp;
  resp.header("X-A", "1").header("x-a", "2");
  EXPECT_EQ(resp.headers().size(), 1U);
  EXPECT_EQ(resp.headerValue("X-A"), "2");
  EXPECT_EQ(resp.headers()[0].name, "X-A");

  resp.addHeader("Set-Cookie", "a=1").addHeader("Set-Cookie", "b=2");
  auto cookies = resp.headerValues("set-cookie");
  ASSERT_EQ(cookies.size(), 2U);
  EXPECT_EQ(cookies[0], "a=1");
  EXPECT_EQ(cookies[1], "b=2");
}

TEST(HttpResponseTest, RemoveHeader) {
  HttpResponse resp;
  resp.addHeader("Set-Cookie", "a=1").addHeader("X-Keep", "k").addHeader("set-cookie", "b=2");
  EXPECT_EQ(resp.removeHeader("Set-Cookie"), 2U);
  ASSERT_EQ(resp.headers().size(), 1U);
  EXPECT_EQ(resp.headers()[0].name, "X-Keep");
  EXPECT_EQ(resp.removeHeader("Absent"), 0U);
}

TEST(HttpResponseTest, UnknownStatusHasNoReason) {
  HttpResponse resp(599);
  EXPECT_TRUE(resp.reason().empty());
}

}  // namespace routekit
