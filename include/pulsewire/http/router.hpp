#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/http/http_types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace pulsewire::http {

using RouteHandler = std::move_only_function<task<HttpResponse>(HttpRequest)>;

/// Exact-path routes. An unknown path answers 404; a known path requested
/// with another method answers 405.
class Router {
public:
  Router();
  ~Router();

  Router(const Router &) = delete;
  auto operator=(const Router &) -> Router & = delete;

  /// Re-registering a method and path replaces the handler.
  auto add_route(HttpMethod method, std::string path, RouteHandler handler)
      -> void;
  auto get(std::string path, RouteHandler handler) -> void {
    add_route(HttpMethod::get, std::move(path), std::move(handler));
  }

  [[nodiscard]] auto route(HttpRequest req) -> task<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pulsewire::http
