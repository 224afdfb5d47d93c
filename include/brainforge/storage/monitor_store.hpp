#pragma once

#include "brainforge/brain/run_status.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/id.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brainforge::storage {

struct WaitingEntry {
  RunId run_id;
  std::optional<std::string> token;
};

struct RunRecord {
  RunId run_id;
  std::string brain_title;
  RunStatus status{RunStatus::Pending};
  std::optional<std::string> error;
  std::int64_t created_at{0};
  std::int64_t started_at{0};
  std::int64_t completed_at{0};
};

struct TimeoutEntry {
  RunId run_id;
  std::int64_t deadline_ms{0};
};

struct PageRecord {
  std::string slug;
  RunId run_id;
  bool persist{false};
};

/// Cross-run registry: who waits on which webhook, run index, webhook
/// deadlines and generated pages.
class MonitorStore {
public:
  virtual ~MonitorStore() = default;

  /// Replaces any registration under the same (slug, identifier).
  [[nodiscard]] virtual auto register_waiting(std::string_view slug,
                                              std::string_view identifier,
                                              WaitingEntry entry)
      -> task<Result<void>> = 0;
  [[nodiscard]] virtual auto find_waiting_run(std::string_view slug,
                                              std::string_view identifier)
      -> task<Result<std::optional<WaitingEntry>>> = 0;
  /// Atomically removes the registration if it still belongs to `run_id`,
  /// together with every other registration of that run. False when another
  /// delivery claimed the wait first.
  [[nodiscard]] virtual auto take_waiting(std::string_view slug,
                                          std::string_view identifier,
                                          const RunId &run_id)
      -> task<Result<bool>> = 0;
  [[nodiscard]] virtual auto clear_waiting(const RunId &run_id)
      -> task<Result<void>> = 0;

  [[nodiscard]] virtual auto upsert_run(const RunRecord &record)
      -> task<Result<void>> = 0;
  [[nodiscard]] virtual auto get_run(const RunId &run_id)
      -> task<Result<std::optional<RunRecord>>> = 0;
  /// Newest first.
  [[nodiscard]] virtual auto list_runs(std::size_t limit)
      -> task<Result<std::vector<RunRecord>>> = 0;

  [[nodiscard]] virtual auto set_timeout(const RunId &run_id,
                                         std::int64_t deadline_ms)
      -> task<Result<void>> = 0;
  [[nodiscard]] virtual auto get_timeout(const RunId &run_id)
      -> task<Result<std::optional<std::int64_t>>> = 0;
  [[nodiscard]] virtual auto clear_timeout(const RunId &run_id)
      -> task<Result<void>> = 0;
  [[nodiscard]] virtual auto list_timeouts()
      -> task<Result<std::vector<TimeoutEntry>>> = 0;

  [[nodiscard]] virtual auto register_page(PageRecord page)
      -> task<Result<void>> = 0;
  [[nodiscard]] virtual auto non_persistent_pages(const RunId &run_id)
      -> task<Result<std::vector<PageRecord>>> = 0;
  [[nodiscard]] virtual auto remove_page(std::string_view slug)
      -> task<Result<void>> = 0;
};

} // namespace brainforge::storage
