#pragma once

#include "brainforge/brain/brain.hpp"
#include "brainforge/brain/event.hpp"
#include "brainforge/brain/signal.hpp"
#include "brainforge/brain/state_machine.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/engine/actor_host.hpp"
#include "brainforge/engine/event_log.hpp"
#include "brainforge/engine/run_actor.hpp"
#include "brainforge/storage/blob_store.hpp"
#include "brainforge/storage/event_store.hpp"
#include "brainforge/storage/monitor_store.hpp"
#include "brainforge/storage/signal_store.hpp"
#include "brainforge/webhook/webhook.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace brainforge {

struct EngineStores {
  storage::EventStore &events;
  storage::SignalStore &signals;
  storage::MonitorStore &monitor;
  storage::BlobStore &blobs;
};

struct EngineOptions {
  std::size_t overflow_threshold{kDefaultOverflowThreshold};
  int max_parallel_tools{4};
};

/// Picks the executor a run lives on, keyed by run id.
using ExecutorSelector = std::move_only_function<Executor(std::string_view) const>;

struct RunInfo {
  storage::RunRecord record;
  JsonValue state;
  std::size_t event_count{0};
};

/// Explicit context of the run engine: registries, stores, executor choice
/// and the live actors.
class Engine final : public ActorHost {
public:
  Engine(BrainRegistry &brains, webhook::WebhookRegistry &webhooks,
         EngineStores stores, EngineOptions options,
         ExecutorSelector select_executor);
  ~Engine() override;

  Engine(const Engine &) = delete;
  auto operator=(const Engine &) -> Engine & = delete;

  /// NotFound for an unknown brain title.
  [[nodiscard]] auto start_run(std::string_view brain_title,
                               JsonValue initial_state) -> task<Result<RunId>>;

  /// Live actor for the run, rebuilt from its log when not in memory.
  [[nodiscard]] auto find_actor(const RunId &run_id)
      -> task<Result<std::shared_ptr<RunActor>>>;

  /// Gate-checks `signal` against the run's recorded status, then queues it
  /// and wakes the run. A rejected signal is reported, not queued.
  [[nodiscard]] auto send_signal(const RunId &run_id, Signal signal)
      -> task<Result<SignalValidation>>;

  [[nodiscard]] auto wake_up(const RunId &run_id)
      -> task<Result<void>> override;

  /// Wakes the run and waits for its actor to go idle.
  [[nodiscard]] auto run_until_idle(const RunId &run_id)
      -> task<Result<void>>;

  [[nodiscard]] auto run_info(const RunId &run_id) -> task<Result<RunInfo>>;
  [[nodiscard]] auto load_events(const RunId &run_id)
      -> task<Result<std::vector<Event>>>;
  [[nodiscard]] auto list_runs(std::size_t limit)
      -> task<Result<std::vector<storage::RunRecord>>>;

  /// After a restart: re-arm stored webhook deadlines and wake runs that were
  /// mid-flight. Returns how many runs were touched.
  [[nodiscard]] auto recover() -> task<Result<std::size_t>>;

  /// Stops alarms and drops every live actor.
  auto shutdown() -> void;

  [[nodiscard]] auto brains() -> BrainRegistry & { return *brains_; }
  [[nodiscard]] auto webhooks() -> webhook::WebhookRegistry & {
    return *webhooks_;
  }
  [[nodiscard]] auto stores() const -> const EngineStores & { return stores_; }
  [[nodiscard]] auto loader() -> EventLoader & { return loader_; }

private:
  [[nodiscard]] auto make_actor(const RunId &run_id,
                                std::shared_ptr<const Brain> brain)
      -> std::shared_ptr<RunActor>;
  [[nodiscard]] auto cached_actor(const RunId &run_id) const
      -> std::shared_ptr<RunActor>;
  /// Keeps the first actor registered for a run; returns the winner.
  auto adopt_actor(std::shared_ptr<RunActor> actor)
      -> std::shared_ptr<RunActor>;

  BrainRegistry *brains_;
  webhook::WebhookRegistry *webhooks_;
  EngineStores stores_;
  EventLog log_;
  EventLoader loader_;
  RunServices services_;
  ExecutorSelector select_executor_;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<RunId, std::shared_ptr<RunActor>> actors_;
};

} // namespace brainforge
