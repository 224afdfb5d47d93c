#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/brain/state_machine.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/storage/blob_store.hpp"
#include "brainforge/storage/monitor_store.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace brainforge {

/// Receiver of webhook deadlines; implemented by the run actor.
class AlarmClock {
public:
  virtual ~AlarmClock() = default;
  virtual auto arm_alarm(std::int64_t deadline_ms) -> void = 0;
};

/// What an adapter sees for one emitted (already persisted) event.
struct AdapterContext {
  const Event &event;
  /// Snapshot after the event was applied.
  const RunSnapshot &snapshot;
  std::string_view brain_title;
  std::int64_t created_at{0};
  AlarmClock &alarm;
};

/// Consumer in the emit chain. Runs on the actor's executor after the event
/// was appended to the log.
class EventAdapter {
public:
  virtual ~EventAdapter() = default;
  [[nodiscard]] virtual auto dispatch(const AdapterContext &ctx)
      -> task<Result<void>> = 0;
};

using AdapterChain = std::vector<std::shared_ptr<EventAdapter>>;

/// Keeps the RunRecord in step with the log and drops stale waiting
/// registrations when a run resumes or ends.
class MonitorAdapter final : public EventAdapter {
public:
  explicit MonitorAdapter(storage::MonitorStore &monitor) : monitor_(&monitor) {}
  auto dispatch(const AdapterContext &ctx) -> task<Result<void>> override;

private:
  storage::MonitorStore *monitor_;
};

/// Registers `(slug, identifier) -> run` for every entry of a WEBHOOK event.
class WebhookAdapter final : public EventAdapter {
public:
  explicit WebhookAdapter(storage::MonitorStore &monitor) : monitor_(&monitor) {}
  auto dispatch(const AdapterContext &ctx) -> task<Result<void>> override;

private:
  storage::MonitorStore *monitor_;
};

/// Persists webhook deadlines and arms the actor alarm.
class TimeoutAdapter final : public EventAdapter {
public:
  explicit TimeoutAdapter(storage::MonitorStore &monitor) : monitor_(&monitor) {}
  auto dispatch(const AdapterContext &ctx) -> task<Result<void>> override;

private:
  storage::MonitorStore *monitor_;
};

/// Deletes non-persistent pages once the run terminates. Never fails the run.
class PageCleanupAdapter final : public EventAdapter {
public:
  PageCleanupAdapter(storage::MonitorStore &monitor, storage::BlobStore &blobs)
      : monitor_(&monitor), blobs_(&blobs) {}
  auto dispatch(const AdapterContext &ctx) -> task<Result<void>> override;

private:
  storage::MonitorStore *monitor_;
  storage::BlobStore *blobs_;
};

[[nodiscard]] auto make_default_adapters(storage::MonitorStore &monitor,
                                         storage::BlobStore &blobs)
    -> AdapterChain;

[[nodiscard]] auto page_blob_key(std::string_view slug) -> std::string;

} // namespace brainforge
