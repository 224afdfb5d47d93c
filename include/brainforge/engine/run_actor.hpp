#pragma once

#include "brainforge/brain/brain.hpp"
#include "brainforge/brain/event.hpp"
#include "brainforge/brain/state_machine.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/engine/adapters.hpp"
#include "brainforge/engine/event_log.hpp"
#include "brainforge/engine/page_service.hpp"
#include "brainforge/storage/signal_store.hpp"
#include "brainforge/util/semaphore.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace brainforge {

/// Shared collaborators of every run actor, owned by the engine.
struct RunServices {
  EventLog &log;
  EventLoader &loader;
  storage::SignalStore &signals;
  storage::MonitorStore &monitor;
  storage::BlobStore &blobs;
  AdapterChain adapters;
  int max_parallel_tools{4};
};

/// Single writer of one run. Every member is touched only on `executor()`;
/// the public entry points hop there themselves.
class RunActor final : public AlarmClock,
                       public std::enable_shared_from_this<RunActor> {
public:
  RunActor(Executor executor, RunId run_id, std::shared_ptr<const Brain> brain,
           RunServices &services);

  RunActor(const RunActor &) = delete;
  auto operator=(const RunActor &) -> RunActor & = delete;

  /// Emits START for a fresh run.
  [[nodiscard]] auto start(JsonValue initial_state) -> task<Result<void>>;

  /// Rebuilds the actor from a persisted log.
  [[nodiscard]] auto restore(std::vector<Event> events) -> task<Result<void>>;

  /// Schedules a tick. Safe from any thread; a wake during a tick folds into
  /// one more pass of the running tick.
  auto wake_up() -> void;

  /// Wakes the actor and waits until it has nothing left to do. Returns the
  /// error of a failed step, or rethrows the exception it threw.
  [[nodiscard]] auto run_until_idle() -> task<Result<void>>;

  auto arm_alarm(std::int64_t deadline_ms) -> void override;

  /// Cancels the alarm. Posted to the actor executor.
  auto shutdown() -> void;

  [[nodiscard]] auto executor() const -> const Executor & { return executor_; }
  [[nodiscard]] auto run_id() const -> const RunId & { return run_id_; }
  [[nodiscard]] auto brain() const -> const Brain & { return *brain_; }

private:
  enum class BlockOutcome : std::uint8_t { Completed, Suspended, Stopped };

  using IdleChannel =
      boost::asio::experimental::concurrent_channel<void(
          boost::system::error_code)>;

  struct ToolRun {
    Result<ToolOutcome> outcome;
    std::exception_ptr thrown;
    std::string message;
  };

  auto request_tick() -> void;
  auto run_ticks() -> task<void>;
  auto tick() -> task<Result<void>>;

  auto emit(EventBody body) -> task<Result<void>>;

  /// Applies pending control signals. False once the run left `running`.
  auto handle_control_signals() -> task<Result<bool>>;
  auto handle_webhook_signals() -> task<Result<void>>;

  auto drive() -> task<Result<void>>;
  auto run_step(std::size_t index, const StepBlock &block)
      -> task<Result<BlockOutcome>>;
  auto run_agent(std::size_t index, const AgentBlock &block)
      -> task<Result<BlockOutcome>>;
  auto execute_tool(const ToolCall &call, const AgentTool &tool)
      -> task<ToolRun>;
  auto complete_step(std::size_t index, JsonValue new_state)
      -> task<Result<void>>;
  auto fail_step(std::size_t index, ErrorInfo error) -> task<Result<void>>;
  auto emit_wait(const WaitRequest &wait) -> task<Result<void>>;
  auto step_status(std::size_t current, std::string_view status) const
      -> StepStatusEvent;
  auto pending_agent_webhook(const std::string &step_id) const -> bool;

  auto alarm_wait(std::uint64_t generation) -> task<void>;
  auto on_alarm() -> task<Result<void>>;

  Executor executor_;
  RunId run_id_;
  std::shared_ptr<const Brain> brain_;
  RunServices *services_;
  PageService pages_;
  Semaphore tool_slots_;

  RunStateMachine machine_;
  std::vector<Event> events_;
  JsonValue state_;
  std::int64_t created_at_{0};
  std::optional<JsonValue> webhook_response_;
  std::deque<std::string> user_messages_;

  bool ticking_{false};
  bool wake_pending_{false};
  std::error_code last_error_;
  std::exception_ptr last_exception_;
  std::vector<std::shared_ptr<IdleChannel>> idle_waiters_;

  boost::asio::steady_timer alarm_timer_;
  std::optional<std::int64_t> alarm_deadline_;
  std::uint64_t alarm_generation_{0};
};

} // namespace brainforge
