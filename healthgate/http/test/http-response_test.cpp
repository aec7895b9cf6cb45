#include "healthgate/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "healthgate/http-status-code.hpp"

namespace healthgate {

TEST(HttpResponse, EmptyBodySerialization) {
  HttpResponse resp(http::StatusCodeServiceUnavailable);
  EXPECT_EQ(resp.serialize(true, false),
            "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\nConnection: keep-alive\r\n\r\n");
  EXPECT_FALSE(resp.headerValue("Content-Type").has_value());
}

TEST(HttpResponse, BodyAndHeaders) {
  auto resp = HttpResponse(http::StatusCodeOK, "hello").header("X-Custom", "1").header("X-Count", 42);
  EXPECT_EQ(resp.headerValue("content-type"), "text/plain");
  EXPECT_EQ(resp.headerValue("x-count"), "42");
  EXPECT_EQ(resp.serialize(false, false, "healthgate"),
            "HTTP/1.1 200 OK\r\nServer: healthgate\r\nContent-Type: text/plain\r\nX-Custom: 1\r\nX-Count: 42\r\n"
            "Content-Length: 5\r\nConnection: close\r\n\r\nhello");
}

TEST(HttpResponse, HeadOnlyKeepsContentLength) {
  HttpResponse resp(http::StatusCodeOK, "hello");
  const std::string wire = resp.serialize(true, true);
  EXPECT_TRUE(wire.contains("Content-Length: 5\r\n"));
  EXPECT_TRUE(wire.ends_with("\r\n\r\n"));
}

TEST(HttpResponse, HeaderReplacesPreviousValue) {
  HttpResponse resp;
  resp.header("X-A", "1").header("x-a", "2");
  EXPECT_EQ(resp.headers().size(), 1U);
  EXPECT_EQ(resp.headerValue("X-A"), "2");
}

TEST(HttpResponse, UserServerHeaderWins) {
  auto resp = HttpResponse().header("Server", "custom");
  const std::string wire = resp.serialize(true, false, "healthgate");
  EXPECT_TRUE(wire.contains("Server: custom\r\n"));
  EXPECT_FALSE(wire.contains("healthgate"));
}

TEST(HttpResponse, ReservedAndInvalidHeadersAreRejected) {
  HttpResponse resp;
  EXPECT_THROW(resp.header("Content-Length", "3"), std::invalid_argument);
  EXPECT_THROW(resp.header("connection", "close"), std::invalid_argument);
  EXPECT_THROW(resp.header("", "x"), std::invalid_argument);
  EXPECT_THROW(resp.header("X-Bad", "a\r\nInjected: 1"), std::invalid_argument);
  EXPECT_TRUE(http::IsReservedResponseHeader("Transfer-Encoding"));
  EXPECT_FALSE(http::IsReservedResponseHeader("X-Transfer-Encoding"));
}

TEST(HttpResponse, EmptyBodyRemovesContentType) {
  HttpResponse resp(http::StatusCodeOK, "data", "application/json");
  EXPECT_EQ(resp.headerValue("Content-Type"), "application/json");
  resp.body("");
  EXPECT_FALSE(resp.headerValue("Content-Type").has_value());
  resp.status(http::StatusCodeNoContent);
  EXPECT_EQ(resp.status(), http::StatusCodeNoContent);
}

}  // namespace healthgate
