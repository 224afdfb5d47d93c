#include "brainforge/app/http/router.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <array>
#include <ranges>
#include <string_view>
#include <tuple>
#include <vector>

namespace brainforge::http {

struct Router::Impl {
  struct RoutePattern {
    std::vector<std::string> segments;
    std::vector<bool> is_param;
  };

  struct Route {
    std::string pattern;
    RoutePattern parsed;
    RouteHandler handler;
  };

  struct MethodRoutes {
    ankerl::unordered_dense::map<std::string, std::size_t, StringHash,
                                 StringEqual>
        static_lookup;
    std::vector<Route> static_routes;
    ankerl::unordered_dense::map<std::size_t, std::vector<Route>>
        dynamic_by_segments;
  };

  std::array<MethodRoutes, 7> methods;

  static auto method_index(HttpMethod method) -> std::size_t {
    return static_cast<std::size_t>(method);
  }

  static auto split_path(std::string_view path)
      -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    for (auto part : path | std::views::split('/')) {
      segments.emplace_back(std::string_view(part));
    }
    return segments;
  }

  static auto parse_segment(std::string_view seg)
      -> std::tuple<std::string, bool> {
    if (seg.size() >= 2 && seg.starts_with('{') && seg.ends_with('}')) {
      return {std::string(seg.substr(1, seg.size() - 2)), true};
    }
    return {std::string(seg), false};
  }

  static auto parse_pattern(std::string_view pattern) -> RoutePattern {
    RoutePattern result;
    for (auto seg : split_path(pattern)) {
      auto [name, is_param] = parse_segment(seg);
      result.segments.emplace_back(std::move(name));
      result.is_param.emplace_back(is_param);
    }
    return result;
  }

  static auto match_route(const RoutePattern &pattern,
                          const std::vector<std::string_view> &path_segments,
                          HttpRequest &req) -> bool {
    if (path_segments.size() != pattern.segments.size()) {
      return false;
    }

    req.path_params.clear();
    for (auto &&[pat_seg, is_param, path_seg] :
         std::views::zip(pattern.segments, pattern.is_param, path_segments)) {
      if (is_param) {
        if (path_seg.empty()) {
          req.path_params.clear();
          return false;
        }
        req.path_params.emplace(pat_seg, path_seg);
      } else if (pat_seg != path_seg) {
        req.path_params.clear();
        return false;
      }
    }
    return true;
  }
};

Router::Router() : impl_(std::make_unique<Impl>()) {}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string path,
                       RouteHandler handler) -> void {
  auto parsed = Impl::parse_pattern(path);
  const bool has_param = std::ranges::any_of(parsed.is_param,
                                             [](bool v) { return v; });

  auto &method_routes = impl_->methods[Impl::method_index(method)];

  if (!has_param) {
    const auto index = method_routes.static_routes.size();
    method_routes.static_lookup.emplace(path, index);
    method_routes.static_routes.emplace_back(
        Impl::Route{.pattern = std::move(path),
                    .parsed = std::move(parsed),
                    .handler = std::move(handler)});
    return;
  }

  auto &bucket = method_routes.dynamic_by_segments[parsed.segments.size()];
  bucket.emplace_back(Impl::Route{.pattern = std::move(path),
                                  .parsed = std::move(parsed),
                                  .handler = std::move(handler)});
}

auto Router::get(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::GET, std::move(path), std::move(handler));
}

auto Router::post(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::POST, std::move(path), std::move(handler));
}

auto Router::del(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::DELETE, std::move(path), std::move(handler));
}

auto Router::route(HttpRequest req) -> brainforge::task<HttpResponse> {
  auto &method_routes = impl_->methods[Impl::method_index(req.method)];

  if (auto it = method_routes.static_lookup.find(req.path);
      it != method_routes.static_lookup.end()) {
    co_return co_await method_routes.static_routes[it->second].handler(
        std::move(req));
  }

  const auto path_segments = Impl::split_path(req.path);
  auto dyn_it = method_routes.dynamic_by_segments.find(path_segments.size());
  if (dyn_it == method_routes.dynamic_by_segments.end()) {
    co_return HttpResponse::not_found();
  }

  for (auto &route : dyn_it->second) {
    if (Impl::match_route(route.parsed, path_segments, req)) {
      co_return co_await route.handler(std::move(req));
    }
  }

  co_return HttpResponse::not_found();
}

} // namespace brainforge::http
