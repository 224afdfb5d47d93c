#include "brainforge/engine/engine.hpp"

#include "brainforge/engine/adapters.hpp"
#include "brainforge/engine/state_reconstructor.hpp"
#include "brainforge/util/log.hpp"

#include <utility>

namespace brainforge {

namespace {
constexpr std::size_t kRecoverScanLimit = 10000;
} // namespace

Engine::Engine(BrainRegistry &brains, webhook::WebhookRegistry &webhooks,
               EngineStores stores, EngineOptions options,
               ExecutorSelector select_executor)
    : brains_(&brains), webhooks_(&webhooks), stores_(stores),
      log_(stores.events, stores.blobs, options.overflow_threshold),
      loader_(stores.events, stores.blobs),
      services_{.log = log_,
                .loader = loader_,
                .signals = stores.signals,
                .monitor = stores.monitor,
                .blobs = stores.blobs,
                .adapters = make_default_adapters(stores.monitor, stores.blobs),
                .max_parallel_tools = options.max_parallel_tools},
      select_executor_(std::move(select_executor)) {}

Engine::~Engine() { shutdown(); }

auto Engine::make_actor(const RunId &run_id,
                        std::shared_ptr<const Brain> brain)
    -> std::shared_ptr<RunActor> {
  return std::make_shared<RunActor>(select_executor_(run_id.value()), run_id,
                                    std::move(brain), services_);
}

auto Engine::cached_actor(const RunId &run_id) const
    -> std::shared_ptr<RunActor> {
  std::lock_guard lock(mu_);
  auto it = actors_.find(run_id);
  return it == actors_.end() ? nullptr : it->second;
}

auto Engine::adopt_actor(std::shared_ptr<RunActor> actor)
    -> std::shared_ptr<RunActor> {
  std::lock_guard lock(mu_);
  return actors_.try_emplace(actor->run_id(), actor).first->second;
}

auto Engine::start_run(std::string_view brain_title, JsonValue initial_state)
    -> task<Result<RunId>> {
  auto brain = brains_->find(brain_title);
  if (!brain) {
    log::warn("Cannot start unknown brain '{}'", brain_title);
    co_return fail(Error::NotFound);
  }

  auto run_id = generate_run_id();
  auto actor = adopt_actor(make_actor(run_id, std::move(brain)));
  if (auto r = co_await actor->start(std::move(initial_state)); !r) {
    log::error("Run {} failed to start: {}", run_id, r.error().message());
    std::lock_guard lock(mu_);
    actors_.erase(run_id);
    co_return fail(r.error());
  }
  log::info("Started run {} of brain '{}'", run_id, brain_title);
  actor->wake_up();
  co_return run_id;
}

auto Engine::find_actor(const RunId &run_id)
    -> task<Result<std::shared_ptr<RunActor>>> {
  if (auto actor = cached_actor(run_id)) {
    co_return actor;
  }

  auto events = co_await loader_.load_all_events(run_id);
  if (!events) {
    co_return fail(events.error());
  }
  if (events->empty()) {
    co_return fail(Error::NotFound);
  }

  std::string title;
  auto record = co_await stores_.monitor.get_run(run_id);
  if (!record) {
    co_return fail(record.error());
  }
  if (*record) {
    title = (*record)->brain_title;
  } else if (const auto *start = events->front().as<StartEvent>()) {
    title = start->title;
  }
  auto brain = brains_->find(title);
  if (!brain) {
    log::error("Run {} belongs to unregistered brain '{}'", run_id, title);
    co_return fail(Error::NotFound);
  }

  auto actor = make_actor(run_id, std::move(brain));
  if (auto r = co_await actor->restore(std::move(*events)); !r) {
    log::error("Cannot rehydrate run {}: {}", run_id, r.error().message());
    co_return fail(r.error());
  }
  auto winner = adopt_actor(actor);
  if (winner != actor) {
    actor->shutdown();
  } else {
    log::debug("Rehydrated run {}", run_id);
  }
  co_return winner;
}

auto Engine::send_signal(const RunId &run_id, Signal signal)
    -> task<Result<SignalValidation>> {
  auto record = co_await stores_.monitor.get_run(run_id);
  if (!record) {
    co_return fail(record.error());
  }
  if (!*record) {
    co_return fail(Error::NotFound);
  }

  auto validation =
      is_signal_valid(brain_machine(), (*record)->status, signal.type);
  if (!validation.valid) {
    log::info("Signal {} for run {} rejected: {}",
              signal_type_name(signal.type), run_id,
              validation.reason.value_or(""));
    co_return validation;
  }

  if (auto r = co_await stores_.signals.queue_signal(run_id, std::move(signal));
      !r) {
    co_return fail(r.error());
  }
  if (auto r = co_await wake_up(run_id); !r) {
    log::warn("Wake of run {} failed: {}", run_id, r.error().message());
  }
  co_return validation;
}

auto Engine::wake_up(const RunId &run_id) -> task<Result<void>> {
  auto actor = co_await find_actor(run_id);
  if (!actor) {
    co_return fail(actor.error());
  }
  (*actor)->wake_up();
  co_return ok();
}

auto Engine::run_until_idle(const RunId &run_id) -> task<Result<void>> {
  auto actor = co_await find_actor(run_id);
  if (!actor) {
    co_return fail(actor.error());
  }
  co_return co_await (*actor)->run_until_idle();
}

auto Engine::load_events(const RunId &run_id)
    -> task<Result<std::vector<Event>>> {
  co_return co_await loader_.load_all_events(run_id);
}

auto Engine::run_info(const RunId &run_id) -> task<Result<RunInfo>> {
  auto events = co_await loader_.load_all_events(run_id);
  if (!events) {
    co_return fail(events.error());
  }
  auto record = co_await stores_.monitor.get_run(run_id);
  if (!record) {
    co_return fail(record.error());
  }
  if (events->empty() && !*record) {
    co_return fail(Error::NotFound);
  }

  auto state = reconstruct_current_state(*events);
  if (!state) {
    co_return fail(state.error());
  }

  RunInfo info{.state = std::move(*state), .event_count = events->size()};
  if (*record) {
    info.record = std::move(**record);
  } else {
    auto snap = RunStateMachine::replay(*events);
    if (!snap) {
      co_return fail(snap.error());
    }
    info.record = storage::RunRecord{.run_id = run_id,
                                     .brain_title = snap->title,
                                     .status = snap->status,
                                     .created_at = events->front().timestamp,
                                     .started_at = snap->started_at,
                                     .completed_at = snap->completed_at};
    if (snap->error) {
      info.record.error = snap->error->message;
    }
  }
  co_return info;
}

auto Engine::list_runs(std::size_t limit)
    -> task<Result<std::vector<storage::RunRecord>>> {
  co_return co_await stores_.monitor.list_runs(limit);
}

auto Engine::recover() -> task<Result<std::size_t>> {
  std::size_t touched = 0;

  auto timeouts = co_await stores_.monitor.list_timeouts();
  if (!timeouts) {
    co_return fail(timeouts.error());
  }
  for (const auto &entry : *timeouts) {
    // Restoring a waiting run re-arms its alarm from the stored deadline.
    if (auto actor = co_await find_actor(entry.run_id); !actor) {
      log::warn("Cannot recover deadline of run {}: {}", entry.run_id,
                actor.error().message());
      continue;
    }
    ++touched;
  }

  auto runs = co_await stores_.monitor.list_runs(kRecoverScanLimit);
  if (!runs) {
    co_return fail(runs.error());
  }
  for (const auto &run : *runs) {
    if (run.status != RunStatus::Running) {
      continue;
    }
    if (auto r = co_await wake_up(run.run_id); !r) {
      log::warn("Cannot recover run {}: {}", run.run_id, r.error().message());
      continue;
    }
    ++touched;
  }
  log::info("Recovered {} runs", touched);
  co_return touched;
}

auto Engine::shutdown() -> void {
  ankerl::unordered_dense::map<RunId, std::shared_ptr<RunActor>> actors;
  {
    std::lock_guard lock(mu_);
    actors.swap(actors_);
  }
  for (auto &[run_id, actor] : actors) {
    actor->shutdown();
  }
}

} // namespace brainforge
