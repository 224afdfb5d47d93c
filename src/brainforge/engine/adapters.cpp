#include "brainforge/engine/adapters.hpp"

#include "brainforge/util/log.hpp"
#include "brainforge/util/time.hpp"

#include <format>

namespace brainforge {

auto page_blob_key(std::string_view slug) -> std::string {
  return std::format("pages/{}.html", slug);
}

auto MonitorAdapter::dispatch(const AdapterContext &ctx)
    -> task<Result<void>> {
  const auto &snap = ctx.snapshot;
  const auto type = ctx.event.type();

  storage::RunRecord record{
      .run_id = ctx.event.run_id,
      .brain_title = std::string(ctx.brain_title),
      .status = snap.status,
      .created_at = ctx.created_at,
      .started_at = snap.started_at,
      .completed_at = snap.completed_at,
  };
  if (snap.error) {
    record.error = snap.error->message;
  }
  if (auto r = co_await monitor_->upsert_run(record); !r) {
    co_return r;
  }

  if (type == EventType::WebhookResponse || is_terminal(snap.status) ||
      (type == EventType::Restart && snap.depth() == 1)) {
    co_return co_await monitor_->clear_waiting(ctx.event.run_id);
  }
  co_return ok();
}

auto WebhookAdapter::dispatch(const AdapterContext &ctx)
    -> task<Result<void>> {
  const auto *webhook = ctx.event.as<WebhookEvent>();
  if (webhook == nullptr) {
    co_return ok();
  }
  for (const auto &wait : webhook->wait_for) {
    auto r = co_await monitor_->register_waiting(
        wait.slug, wait.identifier,
        storage::WaitingEntry{.run_id = ctx.event.run_id, .token = wait.token});
    if (!r) {
      log::error("Cannot register run {} as waiting on {}/{}",
                 ctx.event.run_id, wait.slug, wait.identifier);
      co_return r;
    }
  }
  co_return ok();
}

auto TimeoutAdapter::dispatch(const AdapterContext &ctx)
    -> task<Result<void>> {
  const auto type = ctx.event.type();
  if (const auto *webhook = ctx.event.as<WebhookEvent>()) {
    if (!webhook->timeout_ms) {
      co_return ok();
    }
    const auto deadline = util::now_millis() + *webhook->timeout_ms;
    if (auto r = co_await monitor_->set_timeout(ctx.event.run_id, deadline);
        !r) {
      co_return r;
    }
    ctx.alarm.arm_alarm(deadline);
    co_return ok();
  }
  if (type == EventType::WebhookResponse || is_terminal(ctx.snapshot.status)) {
    co_return co_await monitor_->clear_timeout(ctx.event.run_id);
  }
  co_return ok();
}

auto PageCleanupAdapter::dispatch(const AdapterContext &ctx)
    -> task<Result<void>> {
  if (!is_terminal_event(ctx.event.type()) ||
      !is_terminal(ctx.snapshot.status)) {
    co_return ok();
  }
  auto pages = co_await monitor_->non_persistent_pages(ctx.event.run_id);
  if (!pages) {
    log::warn("Page cleanup for run {} skipped: {}", ctx.event.run_id,
              pages.error().message());
    co_return ok();
  }
  for (const auto &page : *pages) {
    if (auto r = co_await blobs_->remove(page_blob_key(page.slug)); !r) {
      log::warn("Failed to delete page {}: {}", page.slug,
                r.error().message());
      continue;
    }
    if (auto r = co_await monitor_->remove_page(page.slug); !r) {
      log::warn("Failed to unregister page {}: {}", page.slug,
                r.error().message());
    }
  }
  if (!pages->empty()) {
    log::debug("Removed {} page(s) of run {}", pages->size(),
               ctx.event.run_id);
  }
  co_return ok();
}

auto make_default_adapters(storage::MonitorStore &monitor,
                           storage::BlobStore &blobs) -> AdapterChain {
  return {std::make_shared<MonitorAdapter>(monitor),
          std::make_shared<WebhookAdapter>(monitor),
          std::make_shared<TimeoutAdapter>(monitor),
          std::make_shared<PageCleanupAdapter>(monitor, blobs)};
}

} // namespace brainforge
