#pragma once

#include "brainforge/storage/blob_store.hpp"
#include "brainforge/storage/event_store.hpp"
#include "brainforge/storage/monitor_store.hpp"
#include "brainforge/storage/signal_store.hpp"
#include "brainforge/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <utility>

namespace brainforge::storage {

/// Process-local backend for event, signal and monitor data.
class MemoryStore final : public EventStore,
                          public SignalStore,
                          public MonitorStore {
public:
  MemoryStore() = default;

  MemoryStore(const MemoryStore &) = delete;
  MemoryStore &operator=(const MemoryStore &) = delete;

  auto insert_event(const RunId &run_id, EventType type,
                    std::optional<std::string> serialized_event,
                    std::optional<std::string> blob_key)
      -> task<Result<std::int64_t>> override;
  auto update_blob_key(const RunId &run_id, std::int64_t event_id,
                       std::string blob_key) -> task<Result<void>> override;
  auto load_rows(const RunId &run_id)
      -> task<Result<std::vector<EventRow>>> override;
  auto load_row_by_type(const RunId &run_id, EventType type, EventOrder order)
      -> task<Result<std::optional<EventRow>>> override;

  auto queue_signal(const RunId &run_id, Signal signal)
      -> task<Result<void>> override;
  auto get_and_consume_signals(const RunId &run_id, SignalFilter filter)
      -> task<Result<std::vector<Signal>>> override;

  auto register_waiting(std::string_view slug, std::string_view identifier,
                        WaitingEntry entry) -> task<Result<void>> override;
  auto find_waiting_run(std::string_view slug, std::string_view identifier)
      -> task<Result<std::optional<WaitingEntry>>> override;
  auto take_waiting(std::string_view slug, std::string_view identifier,
                    const RunId &run_id) -> task<Result<bool>> override;
  auto clear_waiting(const RunId &run_id) -> task<Result<void>> override;

  auto upsert_run(const RunRecord &record) -> task<Result<void>> override;
  auto get_run(const RunId &run_id)
      -> task<Result<std::optional<RunRecord>>> override;
  auto list_runs(std::size_t limit)
      -> task<Result<std::vector<RunRecord>>> override;

  auto set_timeout(const RunId &run_id, std::int64_t deadline_ms)
      -> task<Result<void>> override;
  auto get_timeout(const RunId &run_id)
      -> task<Result<std::optional<std::int64_t>>> override;
  auto clear_timeout(const RunId &run_id) -> task<Result<void>> override;
  auto list_timeouts() -> task<Result<std::vector<TimeoutEntry>>> override;

  auto register_page(PageRecord page) -> task<Result<void>> override;
  auto non_persistent_pages(const RunId &run_id)
      -> task<Result<std::vector<PageRecord>>> override;
  auto remove_page(std::string_view slug) -> task<Result<void>> override;

  /// Test hook: rewrite a stored row as-is.
  auto put_raw_row(const RunId &run_id, EventRow row) -> void;

private:
  using WaitKey = std::pair<std::string, std::string>;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<RunId, std::vector<EventRow>> events_;
  std::int64_t next_event_id_{1};
  ankerl::unordered_dense::map<RunId, std::deque<Signal>> signals_;
  std::map<WaitKey, WaitingEntry> waiting_;
  ankerl::unordered_dense::map<RunId, RunRecord> runs_;
  ankerl::unordered_dense::map<RunId, std::int64_t> timeouts_;
  ankerl::unordered_dense::map<std::string, PageRecord, StringHash,
                               StringEqual>
      pages_;
};

/// Blob store kept in memory. Optional artificial latency on reads lets tests
/// observe how many fetches are in flight at once.
class MemoryBlobStore final : public BlobStore {
public:
  MemoryBlobStore() = default;
  explicit MemoryBlobStore(std::chrono::milliseconds get_delay)
      : get_delay_(get_delay) {}

  auto put(std::string key, std::string body) -> task<Result<void>> override;
  auto get(std::string key)
      -> task<Result<std::optional<std::string>>> override;
  auto remove(std::string key) -> task<Result<void>> override;

  [[nodiscard]] auto contains(std::string_view key) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto max_concurrent_gets() const noexcept -> int {
    return max_in_flight_.load(std::memory_order_acquire);
  }

private:
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<std::string, std::string, StringHash,
                               StringEqual>
      blobs_;
  std::chrono::milliseconds get_delay_{0};
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

} // namespace brainforge::storage
