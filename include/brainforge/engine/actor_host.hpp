#pragma once

#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/id.hpp"

namespace brainforge {

/// Whoever owns the run actors. The webhook side only needs to nudge one.
class ActorHost {
public:
  virtual ~ActorHost() = default;
  /// Schedules a tick of the run's actor, rehydrating it if needed.
  [[nodiscard]] virtual auto wake_up(const RunId &run_id)
      -> task<Result<void>> = 0;
};

} // namespace brainforge
