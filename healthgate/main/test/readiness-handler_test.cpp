#include "healthgate/readiness-handler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

#include "healthgate/http-codec.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/http-status-code.hpp"
#include "healthgate/settable-readiness.hpp"

namespace healthgate {

namespace {

HttpResponse Probe(HttpHandler& handler) {
  static constexpr std::string_view kRaw = "GET /ready HTTP/1.1\r\nHost: localhost\r\n\r\n";
  HttpRequest request;
  EXPECT_EQ(HttpRequestParser{}.parse(kRaw, request).kind, ParseResult::Kind::Complete);
  return handler.serve(request);
}

}  // namespace

TEST(ReadinessHandler, ReadyByDefault) {
  ReadinessHandler handler;
  EXPECT_TRUE(handler.ready());
  const auto resp = Probe(handler);
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_TRUE(resp.body().empty());
}

TEST(ReadinessHandler, NotReadyAnswers503WithoutBody) {
  ReadinessHandler handler;
  handler.setReady(false);
  EXPECT_FALSE(handler.ready());
  const auto resp = Probe(handler);
  EXPECT_EQ(resp.status(), http::StatusCodeServiceUnavailable);
  EXPECT_TRUE(resp.body().empty());

  handler.setReady(true);
  EXPECT_EQ(Probe(handler).status(), http::StatusCodeOK);
}

TEST(ReadinessHandler, ConstructedNotReady) {
  ReadinessHandler handler(false);
  EXPECT_EQ(Probe(handler).status(), http::StatusCodeServiceUnavailable);
}

TEST(ReadinessHandler, SettingSameValueTwiceIsHarmless) {
  ReadinessHandler handler;
  handler.setReady(false);
  handler.setReady(false);
  EXPECT_FALSE(handler.ready());
}

TEST(ReadinessHandler, ExposesSettableCapability) {
  std::shared_ptr<HttpHandler> handler = std::make_shared<ReadinessHandler>();
  auto* settable = dynamic_cast<SettableReadiness*>(handler.get());
  ASSERT_NE(settable, nullptr);
  settable->setReady(false);
  EXPECT_EQ(Probe(*handler).status(), http::StatusCodeServiceUnavailable);
}

TEST(ReadinessHandler, ConcurrentFlipsAndProbes) {
  ReadinessHandler handler;
  std::atomic<bool> stop{false};
  std::atomic<int> unexpected{0};

  std::vector<std::jthread> probers;
  for (int idx = 0; idx < 4; ++idx) {
    probers.emplace_back([&] {
      while (!stop.load()) {
        const auto status = Probe(handler).status();
        if (status != http::StatusCodeOK && status != http::StatusCodeServiceUnavailable) {
          ++unexpected;
        }
      }
    });
  }
  for (int idx = 0; idx < 1000; ++idx) {
    handler.setReady(idx % 2 == 0);
  }
  handler.setReady(false);
  stop = true;
  probers.clear();

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(Probe(handler).status(), http::StatusCodeServiceUnavailable);
}

}  // namespace healthgate
