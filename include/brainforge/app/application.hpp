#pragma once

#include "brainforge/brain/brain.hpp"
#include "brainforge/config/system_config.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/core/runtime.hpp"
#include "brainforge/webhook/webhook.hpp"

#include <boost/asio/use_future.hpp>

#include <atomic>
#include <memory>

namespace brainforge {

class ApiServer;
class Engine;

namespace storage {
class BlobStore;
class MemoryStore;
class MySQLDatabase;
} // namespace storage

namespace webhook {
class WebhookCoordinator;
}

// Application facade - owns the runtime, the stores and the engine
class Application {
public:
  explicit Application(SystemConfig config = {});
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  // Registries are filled before start().
  [[nodiscard]] auto brains() noexcept -> BrainRegistry & { return brains_; }
  [[nodiscard]] auto webhooks() noexcept -> webhook::WebhookRegistry & {
    return webhooks_;
  }

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Valid between start() and stop().
  [[nodiscard]] auto runtime() noexcept -> Runtime & { return *runtime_; }
  [[nodiscard]] auto engine() -> Engine &;
  [[nodiscard]] auto coordinator() -> webhook::WebhookCoordinator &;
  [[nodiscard]] auto api_server() noexcept -> ApiServer * {
    return api_.get();
  }

  /// Blocks the calling (non-shard) thread until `op` finished on shard 0.
  template <typename T> auto sync_wait(task<T> op) -> T {
    auto fut = co_spawn(runtime_->executor_for(0), std::move(op),
                        boost::asio::use_future);
    return fut.get();
  }

private:
  [[nodiscard]] auto open_stores() -> Result<void>;
  auto close_stores() noexcept -> void;

  std::atomic<bool> running_{false};
  SystemConfig config_;
  std::unique_ptr<Runtime> runtime_;

  BrainRegistry brains_;
  webhook::WebhookRegistry webhooks_;

  std::unique_ptr<storage::MemoryStore> memory_;
  std::unique_ptr<storage::MySQLDatabase> mysql_;
  std::unique_ptr<storage::BlobStore> blobs_;

  std::unique_ptr<Engine> engine_;
  std::unique_ptr<webhook::WebhookCoordinator> coordinator_;
  std::unique_ptr<ApiServer> api_;
};

} // namespace brainforge
