#include "brainforge/app/application.hpp"

#include "brainforge/app/api/api_server.hpp"
#include "brainforge/engine/engine.hpp"
#include "brainforge/storage/file_blob_store.hpp"
#include "brainforge/storage/memory_store.hpp"
#include "brainforge/storage/mysql_database.hpp"
#include "brainforge/util/log.hpp"
#include "brainforge/webhook/coordination.hpp"

#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <utility>

namespace brainforge {

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      runtime_(std::make_unique<Runtime>(
          static_cast<unsigned>(std::max(0, config_.engine.shards)))) {
  std::signal(SIGPIPE, SIG_IGN);
  if (auto r = webhooks_.add_system(webhook::make_ui_form_webhook()); !r) {
    log::error("Cannot register the {} system webhook: {}",
               webhook::kUiFormSlug, r.error().message());
  }
}

Application::~Application() { stop(); }

auto Application::engine() -> Engine & {
  if (!engine_) {
    throw std::logic_error("Application::engine() before start()");
  }
  return *engine_;
}

auto Application::coordinator() -> webhook::WebhookCoordinator & {
  if (!coordinator_) {
    throw std::logic_error("Application::coordinator() before start()");
  }
  return *coordinator_;
}

auto Application::open_stores() -> Result<void> {
  switch (config_.storage.blob_backend) {
  case BlobBackend::Memory:
    blobs_ = std::make_unique<storage::MemoryBlobStore>();
    break;
  case BlobBackend::Filesystem:
    blobs_ =
        std::make_unique<storage::FileBlobStore>(config_.storage.blob_directory);
    break;
  }

  switch (config_.storage.backend) {
  case StorageBackend::Memory:
    memory_ = std::make_unique<storage::MemoryStore>();
    log::info("Using in-memory event store");
    return ok();
  case StorageBackend::Mysql: {
    mysql_ = std::make_unique<storage::MySQLDatabase>(
        runtime_->executor_for(0), config_.database);
    if (auto r = sync_wait(mysql_->open()); !r) {
      log::error("Cannot open MySQL at {}:{}: {}", config_.database.host,
                 config_.database.port, r.error().message());
      mysql_.reset();
      return fail(r.error());
    }
    return ok();
  }
  }
  return fail(Error::InvalidArgument);
}

auto Application::close_stores() noexcept -> void {
  if (mysql_ && mysql_->is_open()) {
    sync_wait(mysql_->close());
  }
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  if (auto r = runtime_->start(); !r) {
    running_ = false;
    return fail(r.error());
  }
  log::start();
  log::info("Runtime started with {} shard(s)", runtime_->shard_count());

  if (auto r = open_stores(); !r) {
    runtime_->stop();
    running_ = false;
    return fail(r.error());
  }

  storage::EventStore &events =
      mysql_ ? static_cast<storage::EventStore &>(*mysql_) : *memory_;
  storage::SignalStore &signals =
      mysql_ ? static_cast<storage::SignalStore &>(*mysql_) : *memory_;
  storage::MonitorStore &monitor =
      mysql_ ? static_cast<storage::MonitorStore &>(*mysql_) : *memory_;

  engine_ = std::make_unique<Engine>(
      brains_, webhooks_,
      EngineStores{.events = events,
                   .signals = signals,
                   .monitor = monitor,
                   .blobs = *blobs_},
      EngineOptions{.overflow_threshold =
                        config_.storage.overflow_threshold_bytes,
                    .max_parallel_tools = config_.engine.max_parallel_tools},
      [rt = runtime_.get()](std::string_view key) -> Executor {
        return rt->executor_for(rt->shard_for(key));
      });
  coordinator_ = std::make_unique<webhook::WebhookCoordinator>(
      webhooks_, monitor, signals, *engine_);

  if (auto recovered = sync_wait(engine_->recover()); !recovered) {
    log::warn("Recovery failed: {}", recovered.error().message());
  }

  if (config_.api.enabled) {
    api_ = std::make_unique<ApiServer>(*this);
    if (auto r = api_->start(); !r) {
      log::error("API server failed to start: {}", r.error().message());
      stop();
      return fail(r.error());
    }
  }
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  log::info("Stopping brainforge...");

  if (api_) {
    api_->stop();
  }
  if (engine_) {
    engine_->shutdown();
  }
  close_stores();
  runtime_->stop();

  api_.reset();
  coordinator_.reset();
  engine_.reset();
  mysql_.reset();
  memory_.reset();
  blobs_.reset();
}

} // namespace brainforge
