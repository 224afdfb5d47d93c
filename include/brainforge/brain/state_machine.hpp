#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/brain/run_status.hpp"
#include "brainforge/brain/signal.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace brainforge {

enum class MachineState : std::uint8_t {
  Idle,
  Running,
  Paused,
  Waiting,
  Complete,
  Error,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(MachineState, Idle, Running, Paused, Waiting, Complete,
                    Error, Cancelled)
BRAINFORGE_DEFINE_ENUM_SERDE(MachineState, MachineState::Idle)

inline constexpr std::size_t kMachineStateCount = 7;

struct Transition {
  EventType event;
  MachineState target;
};

/// Per state, the events it accepts and where each one leads. COMPLETE and
/// ERROR targets apply to the outermost brain; the reducer keeps nested
/// brains running.
struct MachineDefinition {
  std::array<std::vector<Transition>, kMachineStateCount> states;

  [[nodiscard]] auto transition(MachineState from, EventType event) const
      -> std::optional<MachineState>;
  [[nodiscard]] auto accepts(MachineState from, EventType event) const
      -> bool {
    return transition(from, event).has_value();
  }
};

[[nodiscard]] auto brain_machine() -> const MachineDefinition &;

[[nodiscard]] constexpr auto state_for_status(RunStatus status) noexcept
    -> MachineState {
  switch (status) {
  case RunStatus::Pending:
    return MachineState::Idle;
  case RunStatus::Running:
    return MachineState::Running;
  case RunStatus::Paused:
    return MachineState::Paused;
  case RunStatus::Waiting:
    return MachineState::Waiting;
  case RunStatus::Complete:
    return MachineState::Complete;
  case RunStatus::Error:
    return MachineState::Error;
  case RunStatus::Cancelled:
    return MachineState::Cancelled;
  }
  return MachineState::Idle;
}

[[nodiscard]] constexpr auto status_for_state(MachineState state) noexcept
    -> RunStatus {
  switch (state) {
  case MachineState::Idle:
    return RunStatus::Pending;
  case MachineState::Running:
    return RunStatus::Running;
  case MachineState::Paused:
    return RunStatus::Paused;
  case MachineState::Waiting:
    return RunStatus::Waiting;
  case MachineState::Complete:
    return RunStatus::Complete;
  case MachineState::Error:
    return RunStatus::Error;
  case MachineState::Cancelled:
    return RunStatus::Cancelled;
  }
  return RunStatus::Pending;
}

/// The event a signal turns into once the actor consumes it.
[[nodiscard]] constexpr auto signal_event(SignalType type) noexcept
    -> EventType {
  switch (type) {
  case SignalType::Kill:
    return EventType::Cancelled;
  case SignalType::Pause:
    return EventType::Paused;
  case SignalType::Resume:
    return EventType::Resumed;
  case SignalType::UserMessage:
    return EventType::AgentUserMessage;
  case SignalType::WebhookResponse:
    return EventType::WebhookResponse;
  }
  return EventType::Cancelled;
}

struct SignalValidation {
  bool valid{false};
  std::optional<std::string> reason;
};

[[nodiscard]] auto is_signal_valid(const MachineDefinition &machine,
                                   RunStatus status, SignalType signal)
    -> SignalValidation;

/// Wire-level overload: status in snake_case, signal in upper case.
[[nodiscard]] auto is_signal_valid(const MachineDefinition &machine,
                                   std::string_view status,
                                   std::string_view signal)
    -> SignalValidation;

[[nodiscard]] auto valid_signals(const MachineDefinition &machine,
                                 RunStatus status) -> std::vector<SignalType>;

struct BrainFrame {
  std::string title;
  std::optional<std::string> parent_step_id;
};

struct PendingWait {
  std::vector<WaitFor> wait_for;
  std::optional<std::int64_t> timeout_ms;
  std::int64_t since{0};
};

struct RunSnapshot {
  RunStatus status{RunStatus::Pending};
  MachineState state{MachineState::Idle};
  std::vector<BrainFrame> stack;
  std::optional<ErrorInfo> error;
  std::optional<PendingWait> pending_wait;
  /// Step ids of the outermost brain that have completed.
  std::set<std::string> completed_steps;
  /// A webhook response arrived and no step has consumed it yet.
  bool response_pending{false};
  std::string title;
  std::int64_t started_at{0};
  std::int64_t completed_at{0};
  std::size_t event_count{0};

  [[nodiscard]] auto depth() const noexcept -> std::size_t {
    return stack.size();
  }
};

/// Folds events through the machine into a RunSnapshot. Rejected events leave
/// the snapshot untouched.
class RunStateMachine {
public:
  explicit RunStateMachine(const MachineDefinition &machine = brain_machine())
      : machine_(&machine) {}

  [[nodiscard]] auto can_apply(EventType type) const -> bool;
  [[nodiscard]] auto apply(const Event &event) -> Result<void>;

  [[nodiscard]] auto snapshot() const noexcept -> const RunSnapshot & {
    return snapshot_;
  }

  /// CorruptEventLog if the log contains a transition the machine rejects.
  [[nodiscard]] static auto replay(std::span<const Event> events)
      -> Result<RunSnapshot>;

private:
  const MachineDefinition *machine_;
  RunSnapshot snapshot_;
};

} // namespace brainforge
