#include "pulsewire/http/router.hpp"

#include "pulsewire/util/string_map.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace pulsewire::http {

struct Router::Impl {
  struct Endpoint {
    HttpMethod method;
    RouteHandler handler;
  };

  StringMap<std::vector<Endpoint>> paths;
};

Router::Router() : impl_(std::make_unique<Impl>()) {}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string path,
                       RouteHandler handler) -> void {
  auto &endpoints = impl_->paths[std::move(path)];
  auto it = std::ranges::find(endpoints, method, &Impl::Endpoint::method);
  if (it != endpoints.end()) {
    it->handler = std::move(handler);
    return;
  }
  endpoints.push_back({method, std::move(handler)});
}

auto Router::route(HttpRequest req) -> task<HttpResponse> {
  auto path_it = impl_->paths.find(req.path);
  if (path_it == impl_->paths.end()) {
    co_return HttpResponse::plain(HttpStatus::NotFound, "not found");
  }
  auto &endpoints = path_it->second;
  auto it = std::ranges::find(endpoints, req.method, &Impl::Endpoint::method);
  if (it == endpoints.end()) {
    co_return HttpResponse::plain(HttpStatus::MethodNotAllowed,
                                  "method not allowed");
  }
  co_return co_await it->handler(std::move(req));
}

} // namespace pulsewire::http
