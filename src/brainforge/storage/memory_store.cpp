#include "brainforge/storage/memory_store.hpp"

#include "brainforge/core/asio_awaitable.hpp"

#include <algorithm>
#include <ranges>

namespace brainforge::storage {

auto MemoryStore::insert_event(const RunId &run_id, EventType type,
                               std::optional<std::string> serialized_event,
                               std::optional<std::string> blob_key)
    -> task<Result<std::int64_t>> {
  std::lock_guard lock(mu_);
  const auto id = next_event_id_++;
  events_[run_id].push_back(EventRow{.event_id = id,
                                     .event_type = type,
                                     .serialized_event =
                                         std::move(serialized_event),
                                     .blob_key = std::move(blob_key)});
  co_return id;
}

auto MemoryStore::update_blob_key(const RunId &run_id, std::int64_t event_id,
                                  std::string blob_key) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  auto it = events_.find(run_id);
  if (it == events_.end()) {
    co_return fail(Error::NotFound);
  }
  auto row = std::ranges::find(it->second, event_id, &EventRow::event_id);
  if (row == it->second.end()) {
    co_return fail(Error::NotFound);
  }
  row->blob_key = std::move(blob_key);
  co_return ok();
}

auto MemoryStore::load_rows(const RunId &run_id)
    -> task<Result<std::vector<EventRow>>> {
  std::lock_guard lock(mu_);
  auto it = events_.find(run_id);
  if (it == events_.end()) {
    co_return std::vector<EventRow>{};
  }
  co_return it->second;
}

auto MemoryStore::load_row_by_type(const RunId &run_id, EventType type,
                                   EventOrder order)
    -> task<Result<std::optional<EventRow>>> {
  std::lock_guard lock(mu_);
  auto it = events_.find(run_id);
  if (it == events_.end()) {
    co_return std::optional<EventRow>{};
  }
  const auto &rows = it->second;
  auto matches = [type](const EventRow &r) { return r.event_type == type; };
  if (order == EventOrder::Ascending) {
    auto row = std::ranges::find_if(rows, matches);
    co_return row == rows.end() ? std::nullopt
                                : std::optional<EventRow>{*row};
  }
  auto row = std::ranges::find_if(rows | std::views::reverse, matches);
  co_return row == std::ranges::end(rows | std::views::reverse)
      ? std::nullopt
      : std::optional<EventRow>{*row};
}

auto MemoryStore::put_raw_row(const RunId &run_id, EventRow row) -> void {
  std::lock_guard lock(mu_);
  auto &rows = events_[run_id];
  auto existing = std::ranges::find(rows, row.event_id, &EventRow::event_id);
  if (existing != rows.end()) {
    *existing = std::move(row);
    return;
  }
  next_event_id_ = std::max(next_event_id_, row.event_id + 1);
  rows.push_back(std::move(row));
  std::ranges::sort(rows, {}, &EventRow::event_id);
}

auto MemoryStore::queue_signal(const RunId &run_id, Signal signal)
    -> task<Result<void>> {
  std::lock_guard lock(mu_);
  signals_[run_id].push_back(std::move(signal));
  co_return ok();
}

auto MemoryStore::get_and_consume_signals(const RunId &run_id,
                                          SignalFilter filter)
    -> task<Result<std::vector<Signal>>> {
  std::lock_guard lock(mu_);
  std::vector<Signal> out;
  auto it = signals_.find(run_id);
  if (it == signals_.end()) {
    co_return out;
  }
  auto &queue = it->second;
  std::deque<Signal> remaining;
  for (auto &signal : queue) {
    if (signal.matches(filter)) {
      out.push_back(std::move(signal));
    } else {
      remaining.push_back(std::move(signal));
    }
  }
  queue = std::move(remaining);
  co_return out;
}

auto MemoryStore::register_waiting(std::string_view slug,
                                   std::string_view identifier,
                                   WaitingEntry entry) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  waiting_.insert_or_assign(WaitKey{slug, identifier}, std::move(entry));
  co_return ok();
}

auto MemoryStore::find_waiting_run(std::string_view slug,
                                   std::string_view identifier)
    -> task<Result<std::optional<WaitingEntry>>> {
  std::lock_guard lock(mu_);
  auto it = waiting_.find(WaitKey{slug, identifier});
  if (it == waiting_.end()) {
    co_return std::optional<WaitingEntry>{};
  }
  co_return std::optional<WaitingEntry>{it->second};
}

auto MemoryStore::take_waiting(std::string_view slug,
                               std::string_view identifier,
                               const RunId &run_id) -> task<Result<bool>> {
  std::lock_guard lock(mu_);
  auto it = waiting_.find(WaitKey{slug, identifier});
  if (it == waiting_.end() || it->second.run_id != run_id) {
    co_return false;
  }
  std::erase_if(waiting_,
                [&](const auto &kv) { return kv.second.run_id == run_id; });
  co_return true;
}

auto MemoryStore::clear_waiting(const RunId &run_id) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  std::erase_if(waiting_,
                [&](const auto &kv) { return kv.second.run_id == run_id; });
  co_return ok();
}

auto MemoryStore::upsert_run(const RunRecord &record) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  runs_.insert_or_assign(record.run_id, record);
  co_return ok();
}

auto MemoryStore::get_run(const RunId &run_id)
    -> task<Result<std::optional<RunRecord>>> {
  std::lock_guard lock(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    co_return std::optional<RunRecord>{};
  }
  co_return std::optional<RunRecord>{it->second};
}

auto MemoryStore::list_runs(std::size_t limit)
    -> task<Result<std::vector<RunRecord>>> {
  std::vector<RunRecord> out;
  {
    std::lock_guard lock(mu_);
    out.reserve(runs_.size());
    for (const auto &[id, record] : runs_) {
      out.push_back(record);
    }
  }
  std::ranges::sort(out, std::ranges::greater{}, &RunRecord::created_at);
  if (out.size() > limit) {
    out.resize(limit);
  }
  co_return out;
}

auto MemoryStore::set_timeout(const RunId &run_id, std::int64_t deadline_ms)
    -> task<Result<void>> {
  std::lock_guard lock(mu_);
  timeouts_.insert_or_assign(run_id, deadline_ms);
  co_return ok();
}

auto MemoryStore::get_timeout(const RunId &run_id)
    -> task<Result<std::optional<std::int64_t>>> {
  std::lock_guard lock(mu_);
  auto it = timeouts_.find(run_id);
  if (it == timeouts_.end()) {
    co_return std::optional<std::int64_t>{};
  }
  co_return std::optional<std::int64_t>{it->second};
}

auto MemoryStore::clear_timeout(const RunId &run_id) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  timeouts_.erase(run_id);
  co_return ok();
}

auto MemoryStore::list_timeouts() -> task<Result<std::vector<TimeoutEntry>>> {
  std::lock_guard lock(mu_);
  std::vector<TimeoutEntry> out;
  out.reserve(timeouts_.size());
  for (const auto &[run_id, deadline] : timeouts_) {
    out.push_back({.run_id = run_id, .deadline_ms = deadline});
  }
  co_return out;
}

auto MemoryStore::register_page(PageRecord page) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  auto slug = page.slug;
  pages_.insert_or_assign(std::move(slug), std::move(page));
  co_return ok();
}

auto MemoryStore::non_persistent_pages(const RunId &run_id)
    -> task<Result<std::vector<PageRecord>>> {
  std::lock_guard lock(mu_);
  std::vector<PageRecord> out;
  for (const auto &[slug, page] : pages_) {
    if (page.run_id == run_id && !page.persist) {
      out.push_back(page);
    }
  }
  co_return out;
}

auto MemoryStore::remove_page(std::string_view slug) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  if (auto it = pages_.find(slug); it != pages_.end()) {
    pages_.erase(it);
  }
  co_return ok();
}

auto MemoryBlobStore::put(std::string key, std::string body)
    -> task<Result<void>> {
  std::lock_guard lock(mu_);
  blobs_.insert_or_assign(std::move(key), std::move(body));
  co_return ok();
}

auto MemoryBlobStore::get(std::string key)
    -> task<Result<std::optional<std::string>>> {
  const int now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
  int seen = max_in_flight_.load(std::memory_order_acquire);
  while (now > seen &&
         !max_in_flight_.compare_exchange_weak(seen, now,
                                               std::memory_order_acq_rel)) {
  }

  if (get_delay_.count() > 0) {
    (void)co_await async_sleep(get_delay_);
  }

  std::optional<std::string> body;
  {
    std::lock_guard lock(mu_);
    if (auto it = blobs_.find(key); it != blobs_.end()) {
      body = it->second;
    }
  }
  in_flight_.fetch_sub(1, std::memory_order_acq_rel);
  co_return body;
}

auto MemoryBlobStore::remove(std::string key) -> task<Result<void>> {
  std::lock_guard lock(mu_);
  if (auto it = blobs_.find(key); it != blobs_.end()) {
    blobs_.erase(it);
  }
  co_return ok();
}

auto MemoryBlobStore::contains(std::string_view key) const -> bool {
  std::lock_guard lock(mu_);
  return blobs_.contains(key);
}

auto MemoryBlobStore::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return blobs_.size();
}

} // namespace brainforge::storage
