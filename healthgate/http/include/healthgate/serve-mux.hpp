#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "healthgate/http-handler.hpp"

namespace healthgate {

// Request multiplexer dispatching on the request path.
//
// Matching rules:
//  - a pattern without trailing slash ("/ready") matches that exact path only
//  - a pattern with a trailing slash ("/api/") matches the whole subtree below it
//  - the longest matching pattern wins, so "/" is the catch-all
//  - registering a pattern again replaces its handler (last registration wins)
//  - requests matching no pattern are answered 404
class ServeMux final : public HttpHandler {
 public:
  ServeMux() = default;

  // Registers 'handler' for 'pattern'.
  // Throws std::invalid_argument if 'pattern' does not start with '/' or if 'handler' is null.
  void handle(std::string_view pattern, std::shared_ptr<HttpHandler> handler);

  void handle(std::string_view pattern, RequestHandler handler) { handle(pattern, MakeHandler(std::move(handler))); }

  // Returns the handler that would serve 'path', or nullptr if none matches.
  [[nodiscard]] std::shared_ptr<HttpHandler> match(std::string_view path) const;

  HttpResponse serve(const HttpRequest& request) override;

  [[nodiscard]] std::size_t size() const;

 private:
  struct Entry {
    std::string pattern;
    std::shared_ptr<HttpHandler> handler;
  };

  mutable std::mutex _mutex;
  std::vector<Entry> _entries;
};

}  // namespace healthgate
