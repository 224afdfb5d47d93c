#pragma once

#include "brainforge/app/http/http_types.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"

#include <cstdint>
#include <memory>

namespace brainforge {

class Application;

/// REST surface: webhook ingress, run control and inspection, health.
class ApiServer {
public:
  explicit ApiServer(Application &app);
  ~ApiServer();

  ApiServer(const ApiServer &) = delete;
  auto operator=(const ApiServer &) -> ApiServer & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] auto port() const -> std::uint16_t;

  /// Routes a request without going through a socket.
  [[nodiscard]] auto handle(http::HttpRequest req) -> task<http::HttpResponse>;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace brainforge
