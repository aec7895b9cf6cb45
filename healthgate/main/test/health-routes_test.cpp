#include "healthgate/health-routes.hpp"

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
#include "healthgate/probe-server-config.hpp"
#include "healthgate/readiness-handler.hpp"
#include "healthgate/serve-mux.hpp"

namespace healthgate {

namespace {

std::shared_ptr<HttpHandler> Named(std::string name) {
  return MakeHandler([name = std::move(name)](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, name); });
}

// Body of the answer for 200 responses, the status code otherwise.
std::string ServePath(ServeMux& mux, std::string_view path) {
  const std::string raw = "GET " + std::string(path) + " HTTP/1.1\r\n\r\n";
  HttpRequest request;
  EXPECT_EQ(HttpRequestParser{}.parse(raw, request).kind, ParseResult::Kind::Complete);
  const auto resp = mux.serve(request);
  return resp.status() == http::StatusCodeOK ? std::string(resp.body()) : std::to_string(resp.status());
}

}  // namespace

TEST(BindHealthRoutes, DefaultPaths) {
  auto mux = BindHealthRoutes(ProbeServerConfig{}, Named("ready"), Named("alive"), Named("app"));
  EXPECT_EQ(mux->size(), 3U);
  EXPECT_EQ(ServePath(*mux, "/ready"), "ready");
  EXPECT_EQ(ServePath(*mux, "/health"), "alive");
  EXPECT_EQ(ServePath(*mux, "/"), "app");
  EXPECT_EQ(ServePath(*mux, "/orders/42"), "app");
  EXPECT_EQ(ServePath(*mux, "/ready/sub"), "app");
  EXPECT_EQ(ServePath(*mux, "/health?verbose=1"), "alive");
}

TEST(BindHealthRoutes, DefaultProbeHandlersAnswerEmpty200) {
  auto mux = BindHealthRoutes(ProbeServerConfig{}, std::make_shared<ReadinessHandler>(),
                              std::make_shared<ReadinessHandler>(), Named("app"));
  EXPECT_EQ(ServePath(*mux, "/ready"), "");
  EXPECT_EQ(ServePath(*mux, "/health"), "");
}

TEST(BindHealthRoutes, MissingApplicationHandlerAnswers404) {
  auto mux = BindHealthRoutes(ProbeServerConfig{}, Named("ready"), Named("alive"), nullptr);
  EXPECT_EQ(ServePath(*mux, "/ready"), "ready");
  EXPECT_EQ(ServePath(*mux, "/anything"), "404");
}

TEST(BindHealthRoutes, CustomPaths) {
  ProbeServerConfig config;
  config.withReadyPath("/readyz").withAlivePath("/livez");
  auto mux = BindHealthRoutes(config, Named("ready"), Named("alive"), Named("app"));
  EXPECT_EQ(ServePath(*mux, "/readyz"), "ready");
  EXPECT_EQ(ServePath(*mux, "/livez"), "alive");
  EXPECT_EQ(ServePath(*mux, "/ready"), "app");
  EXPECT_EQ(ServePath(*mux, "/health"), "app");
}

TEST(BindHealthRoutes, EmptyPathsFallBackToDefaults) {
  ProbeServerConfig config;
  config.withReadyPath("").withAlivePath("");
  auto mux = BindHealthRoutes(config, Named("ready"), Named("alive"), Named("app"));
  EXPECT_EQ(ServePath(*mux, "/ready"), "ready");
  EXPECT_EQ(ServePath(*mux, "/health"), "alive");
}

TEST(BindHealthRoutes, SameProbePathLastRegistrationWins) {
  ProbeServerConfig config;
  config.withReadyPath("/probe").withAlivePath("/probe");
  auto mux = BindHealthRoutes(config, Named("ready"), Named("alive"), Named("app"));
  EXPECT_EQ(mux->size(), 2U);
  EXPECT_EQ(ServePath(*mux, "/probe"), "alive");
}

TEST(BindHealthRoutes, RootProbePathIsReplacedByApplication) {
  ProbeServerConfig config;
  config.withReadyPath("/");
  auto mux = BindHealthRoutes(config, Named("ready"), Named("alive"), Named("app"));
  EXPECT_EQ(ServePath(*mux, "/"), "app");
  EXPECT_EQ(ServePath(*mux, "/health"), "alive");
}

TEST(BindHealthRoutes, NullProbeHandlerThrows) {
  EXPECT_THROW(BindHealthRoutes(ProbeServerConfig{}, nullptr, Named("alive"), Named("app")), std::invalid_argument);
  EXPECT_THROW(BindHealthRoutes(ProbeServerConfig{}, Named("ready"), nullptr, Named("app")), std::invalid_argument);
}

}  // namespace healthgate
