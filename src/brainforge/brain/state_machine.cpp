#include "brainforge/brain/state_machine.hpp"

#include "brainforge/util/overloaded.hpp"

#include <format>
#include <utility>

namespace brainforge {

namespace {

auto build_brain_machine() -> MachineDefinition {
  using enum EventType;
  MachineDefinition def;
  auto &idle = def.states[std::to_underlying(MachineState::Idle)];
  auto &running = def.states[std::to_underlying(MachineState::Running)];
  auto &paused = def.states[std::to_underlying(MachineState::Paused)];
  auto &waiting = def.states[std::to_underlying(MachineState::Waiting)];
  auto &error = def.states[std::to_underlying(MachineState::Error)];

  idle = {{Start, MachineState::Running}, {Restart, MachineState::Running}};

  running = {
      {Start, MachineState::Running},
      {Restart, MachineState::Running},
      {Complete, MachineState::Complete},
      {Error, MachineState::Error},
      {Cancelled, MachineState::Cancelled},
      {Paused, MachineState::Paused},
      {Webhook, MachineState::Waiting},
      {StepStart, MachineState::Running},
      {StepComplete, MachineState::Running},
      {StepStatus, MachineState::Running},
      {StepRetry, MachineState::Running},
      {AgentStart, MachineState::Running},
      {AgentIteration, MachineState::Running},
      {AgentToolCall, MachineState::Running},
      {AgentToolResult, MachineState::Running},
      {AgentAssistantMessage, MachineState::Running},
      {AgentComplete, MachineState::Running},
      {AgentTokenLimit, MachineState::Running},
      {AgentWebhook, MachineState::Running},
      {AgentUserMessage, MachineState::Running},
  };

  paused = {{Resumed, MachineState::Running},
            {Cancelled, MachineState::Cancelled},
            {Restart, MachineState::Running}};

  waiting = {{WebhookResponse, MachineState::Running},
             {Cancelled, MachineState::Cancelled},
             {Restart, MachineState::Running}};

  error = {{StepStatus, MachineState::Error}};
  return def;
}

} // namespace

auto MachineDefinition::transition(MachineState from, EventType event) const
    -> std::optional<MachineState> {
  for (const auto &t : states.at(std::to_underlying(from))) {
    if (t.event == event) {
      return t.target;
    }
  }
  return std::nullopt;
}

auto brain_machine() -> const MachineDefinition & {
  static const MachineDefinition machine = build_brain_machine();
  return machine;
}

auto is_signal_valid(const MachineDefinition &machine, RunStatus status,
                     SignalType signal) -> SignalValidation {
  if (machine.accepts(state_for_status(status), signal_event(signal))) {
    return {.valid = true};
  }
  return {.valid = false,
          .reason = std::format("Cannot {} brain in '{}' state",
                                signal_type_name(signal),
                                to_string_view(status))};
}

auto is_signal_valid(const MachineDefinition &machine, std::string_view status,
                     std::string_view signal) -> SignalValidation {
  auto signal_type = parse_signal_type(signal);
  if (!signal_type) {
    return {.valid = false,
            .reason = std::format("Unknown signal type: {}", signal)};
  }
  auto run_status = util::try_parse_enum<RunStatus>(status);
  if (!run_status) {
    return {.valid = false,
            .reason = std::format("Unknown brain status: {}", status)};
  }
  return is_signal_valid(machine, *run_status, *signal_type);
}

auto valid_signals(const MachineDefinition &machine, RunStatus status)
    -> std::vector<SignalType> {
  std::vector<SignalType> out;
  for (auto type : kAllSignalTypes) {
    if (machine.accepts(state_for_status(status), signal_event(type))) {
      out.push_back(type);
    }
  }
  return out;
}

auto RunStateMachine::can_apply(EventType type) const -> bool {
  return machine_->accepts(snapshot_.state, type);
}

auto RunStateMachine::apply(const Event &event) -> Result<void> {
  auto target = machine_->transition(snapshot_.state, event.type());
  if (!target) {
    return fail(Error::InvalidState);
  }

  auto &s = snapshot_;
  const auto from = s.state;
  auto next = *target;

  auto enter_brain = [&](const std::string &title,
                         const std::optional<std::string> &parent,
                         bool restart) {
    const bool nested = from == MachineState::Running && !s.stack.empty();
    if (!nested) {
      s.stack.clear();
      s.title = title;
      s.error.reset();
      s.completed_at = 0;
      if (s.started_at == 0) {
        s.started_at = event.timestamp;
      }
      if (restart) {
        s.completed_steps.clear();
        s.response_pending = false;
      }
    }
    s.pending_wait.reset();
    s.stack.push_back({.title = title, .parent_step_id = parent});
  };

  std::visit(
      overloaded{
          [&](const StartEvent &e) {
            enter_brain(e.title, e.parent_step_id, false);
          },
          [&](const RestartEvent &e) {
            enter_brain(e.title, e.parent_step_id, true);
          },
          [&](const CompleteEvent &) {
            if (s.stack.size() > 1) {
              s.stack.pop_back();
              next = MachineState::Running;
              return;
            }
            s.stack.clear();
            s.completed_at = event.timestamp;
          },
          [&](const ErrorEvent &e) {
            if (s.stack.size() > 1) {
              s.stack.pop_back();
              next = MachineState::Running;
              return;
            }
            s.error = e.error;
            s.completed_at = event.timestamp;
          },
          [&](const CancelledEvent &e) {
            s.error = e.error;
            s.pending_wait.reset();
            s.completed_at = event.timestamp;
          },
          [&](const WebhookEvent &e) {
            s.pending_wait = PendingWait{.wait_for = e.wait_for,
                                         .timeout_ms = e.timeout_ms,
                                         .since = event.timestamp};
          },
          [&](const WebhookResponseEvent &) {
            s.pending_wait.reset();
            s.response_pending = true;
          },
          [&](const StepCompleteEvent &e) {
            if (s.stack.size() == 1) {
              s.completed_steps.insert(e.step_id);
              s.response_pending = false;
            }
          },
          [](const auto &) {},
      },
      event.body);

  s.state = next;
  s.status = status_for_state(next);
  ++s.event_count;
  return ok();
}

auto RunStateMachine::replay(std::span<const Event> events)
    -> Result<RunSnapshot> {
  RunStateMachine machine;
  for (const auto &event : events) {
    if (auto r = machine.apply(event); !r) {
      return fail(Error::CorruptEventLog);
    }
  }
  return machine.snapshot();
}

} // namespace brainforge
