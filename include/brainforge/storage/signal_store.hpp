#pragma once

#include "brainforge/brain/signal.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/id.hpp"

#include <vector>

namespace brainforge::storage {

/// Per-run FIFO of signals. Consumption is atomic with respect to enqueue.
class SignalStore {
public:
  virtual ~SignalStore() = default;

  [[nodiscard]] virtual auto queue_signal(const RunId &run_id, Signal signal)
      -> task<Result<void>> = 0;

  /// Removes and returns every queued signal matching `filter`, oldest first.
  [[nodiscard]] virtual auto get_and_consume_signals(const RunId &run_id,
                                                     SignalFilter filter)
      -> task<Result<std::vector<Signal>>> = 0;
};

} // namespace brainforge::storage
