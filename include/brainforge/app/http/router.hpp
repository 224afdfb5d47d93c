#pragma once

#include "brainforge/app/http/http_types.hpp"
#include "brainforge/core/coroutine.hpp"

#include <functional>
#include <memory>
#include <string>

namespace brainforge::http {

using RouteHandler =
    std::move_only_function<brainforge::task<HttpResponse>(HttpRequest)>;

/// Method + path dispatch. Patterns use `{name}` segments; static routes win
/// over patterns, and patterns are tried in registration order.
class Router {
public:
  Router();
  ~Router();

  Router(const Router &) = delete;
  auto operator=(const Router &) -> Router & = delete;

  auto add_route(HttpMethod method, std::string path, RouteHandler handler)
      -> void;

  auto get(std::string path, RouteHandler handler) -> void;
  auto post(std::string path, RouteHandler handler) -> void;
  auto del(std::string path, RouteHandler handler) -> void;

  [[nodiscard]] auto route(HttpRequest req) -> brainforge::task<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace brainforge::http
