#pragma once

#include <mutex>

#include "healthgate/http-handler.hpp"
#include "healthgate/settable-readiness.hpp"

namespace healthgate {

// Probe handler answering 200 while ready and 503 otherwise, with an empty body.
// Ready at construction. Safe to flip from any thread while requests are being served.
class ReadinessHandler final : public HttpHandler, public SettableReadiness {
 public:
  explicit ReadinessHandler(bool ready = true) noexcept : _ready(ready) {}

  HttpResponse serve(const HttpRequest& request) override;

  void setReady(bool ready) override;

  [[nodiscard]] bool ready() const;

 private:
  mutable std::mutex _mutex;
  bool _ready;
};

}  // namespace healthgate
