#pragma once

#include "brainforge/app/http/http_types.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace brainforge {
class Runtime;
}

namespace brainforge::http {

class Router;

/// HTTP/1.1 server on Boost.Beast. Connections are spread across the runtime
/// shards.
class HttpServer {
public:
  explicit HttpServer(Runtime &runtime);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  auto router() -> Router &;

  /// Binds and listens, then returns; accepting continues in the background.
  /// With port 0 the kernel picks one, see `port()`.
  [[nodiscard]] auto start(std::string_view host, std::uint16_t port)
      -> task<Result<void>>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto port() const -> std::uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace brainforge::http
