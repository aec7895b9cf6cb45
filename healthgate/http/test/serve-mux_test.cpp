#include "healthgate/serve-mux.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "healthgate/http-codec.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/http-status-code.hpp"

namespace healthgate {

namespace {

std::shared_ptr<HttpHandler> Named(std::string name) {
  return MakeHandler([name = std::move(name)](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, name); });
}

std::string ServePath(ServeMux& mux, std::string_view path) {
  const std::string raw = "GET " + std::string(path) + " HTTP/1.1\r\n\r\n";
  HttpRequest request;
  EXPECT_EQ(HttpRequestParser{}.parse(raw, request).kind, ParseResult::Kind::Complete);
  const auto resp = mux.serve(request);
  return resp.status() == http::StatusCodeOK ? std::string(resp.body()) : std::to_string(resp.status());
}

}  // namespace

TEST(ServeMux, ExactPatterns) {
  ServeMux mux;
  mux.handle("/ready", Named("ready"));
  mux.handle("/health", Named("health"));
  EXPECT_EQ(ServePath(mux, "/ready"), "ready");
  EXPECT_EQ(ServePath(mux, "/health"), "health");
  EXPECT_EQ(ServePath(mux, "/ready/sub"), "404");
  EXPECT_EQ(ServePath(mux, "/readyx"), "404");
  EXPECT_EQ(ServePath(mux, "/"), "404");
}

TEST(ServeMux, RootIsCatchAll) {
  ServeMux mux;
  mux.handle("/ready", Named("ready"));
  mux.handle("/", Named("app"));
  EXPECT_EQ(ServePath(mux, "/ready"), "ready");
  EXPECT_EQ(ServePath(mux, "/"), "app");
  EXPECT_EQ(ServePath(mux, "/anything/else"), "app");
  EXPECT_EQ(ServePath(mux, "/ready?x=1"), "ready");
}

TEST(ServeMux, LongestSubtreeWins) {
  ServeMux mux;
  mux.handle("/", Named("root"));
  mux.handle("/api/", Named("api"));
  mux.handle("/api/v2/", Named("v2"));
  EXPECT_EQ(ServePath(mux, "/api/users"), "api");
  EXPECT_EQ(ServePath(mux, "/api/v2/users"), "v2");
  EXPECT_EQ(ServePath(mux, "/api"), "root");
}

TEST(ServeMux, LastRegistrationWins) {
  ServeMux mux;
  mux.handle("/health", Named("first"));
  mux.handle("/health", Named("second"));
  EXPECT_EQ(mux.size(), 1U);
  EXPECT_EQ(ServePath(mux, "/health"), "second");
}

TEST(ServeMux, FunctionOverload) {
  ServeMux mux;
  mux.handle("/fn", [](const HttpRequest& req) { return HttpResponse(http::StatusCodeOK, req.path()); });
  EXPECT_EQ(ServePath(mux, "/fn"), "/fn");
  EXPECT_EQ(mux.match("/other"), nullptr);
}

TEST(ServeMux, InvalidRegistrations) {
  ServeMux mux;
  EXPECT_THROW(mux.handle("", Named("x")), std::invalid_argument);
  EXPECT_THROW(mux.handle("ready", Named("x")), std::invalid_argument);
  EXPECT_THROW(mux.handle("/x", std::shared_ptr<HttpHandler>{}), std::invalid_argument);
  EXPECT_THROW(mux.handle("/x", RequestHandler{}), std::invalid_argument);
}

TEST(NotFoundHandler, Answers404) {
  HttpRequest request;
  ASSERT_EQ(HttpRequestParser{}.parse("GET /x HTTP/1.1\r\n\r\n", request).kind, ParseResult::Kind::Complete);
  EXPECT_EQ(NotFoundHandler()->serve(request).status(), http::StatusCodeNotFound);
}

}  // namespace healthgate
