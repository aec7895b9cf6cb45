#include "healthgate/serve-mux.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/log.hpp"

namespace healthgate {

namespace {

bool Matches(std::string_view pattern, std::string_view path) {
  if (pattern.ends_with('/')) {
    return path.starts_with(pattern);
  }
  return path == pattern;
}

}  // namespace

void ServeMux::handle(std::string_view pattern, std::shared_ptr<HttpHandler> handler) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("ServeMux pattern must start with '/'");
  }
  if (!handler) {
    throw std::invalid_argument("ServeMux handler cannot be null");
  }
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = std::ranges::find(_entries, pattern, &Entry::pattern);
  if (it != _entries.end()) {
    log::debug("ServeMux: handler for '{}' replaced", pattern);
    it->handler = std::move(handler);
  } else {
    _entries.push_back(Entry{std::string(pattern), std::move(handler)});
  }
}

std::shared_ptr<HttpHandler> ServeMux::match(std::string_view path) const {
  std::lock_guard<std::mutex> lock(_mutex);
  const Entry* best = nullptr;
  for (const auto& entry : _entries) {
    if (Matches(entry.pattern, path) && (best == nullptr || entry.pattern.size() > best->pattern.size())) {
      best = &entry;
    }
  }
  return best == nullptr ? nullptr : best->handler;
}

HttpResponse ServeMux::serve(const HttpRequest& request) {
  auto handler = match(request.path());
  if (!handler) {
    handler = NotFoundHandler();
  }
  return handler->serve(request);
}

std::size_t ServeMux::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries.size();
}

}  // namespace healthgate
