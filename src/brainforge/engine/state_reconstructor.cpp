#include "brainforge/engine/state_reconstructor.hpp"

#include "brainforge/util/json_patch.hpp"
#include "brainforge/util/log.hpp"

#include <algorithm>
#include <optional>

namespace brainforge {

auto reconstruct_state_at_event(std::span<const Event> events,
                                 std::ptrdiff_t target_index)
    -> Result<JsonValue> {
  if (events.empty()) {
    return make_json_object();
  }
  const auto last = static_cast<std::ptrdiff_t>(events.size()) - 1;
  const auto target =
      static_cast<std::size_t>(std::clamp<std::ptrdiff_t>(target_index, 0, last));

  std::optional<std::size_t> begin;
  JsonValue state = make_json_object();
  for (std::size_t i = target + 1; i-- > 0;) {
    if (const auto *start = events[i].as<StartEvent>()) {
      state = start->initial_state;
      begin = i + 1;
      break;
    }
    if (const auto *restart = events[i].as<RestartEvent>()) {
      state = restart->initial_state;
      begin = i + 1;
      break;
    }
  }
  if (!begin) {
    // Nothing to replay onto: a log without a brain entry has no state.
    return make_json_object();
  }
  if (state.is_null()) {
    state = make_json_object();
  }

  for (std::size_t i = *begin; i <= target; ++i) {
    const auto *step = events[i].as<StepCompleteEvent>();
    if (step == nullptr) {
      continue;
    }
    auto next = apply_patch(state, step->patch);
    if (!next) {
      log::error("Cannot apply patch of step {} (event {}): {}", step->step_id,
                 events[i].event_id, next.error().message());
      return fail(next.error());
    }
    state = std::move(*next);
  }
  return state;
}

auto reconstruct_current_state(std::span<const Event> events)
    -> Result<JsonValue> {
  return reconstruct_state_at_event(
      events, static_cast<std::ptrdiff_t>(events.size()) - 1);
}

} // namespace brainforge
