#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/json.hpp"

#include <cstddef>
#include <span>

namespace brainforge {

/// State as of `events[target_index]`. The index is clamped into the log;
/// an empty log yields `{}`. Replays STEP_COMPLETE patches on top of the
/// initial state of the nearest START/RESTART at or before the index.
[[nodiscard]] auto reconstruct_state_at_event(std::span<const Event> events,
                                              std::ptrdiff_t target_index)
    -> Result<JsonValue>;

[[nodiscard]] auto reconstruct_current_state(std::span<const Event> events)
    -> Result<JsonValue>;

} // namespace brainforge
