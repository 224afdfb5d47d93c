#include "brainforge/engine/event_log.hpp"

#include "brainforge/brain/event_codec.hpp"
#include "brainforge/core/when_all.hpp"
#include "brainforge/util/log.hpp"

#include <format>
#include <utility>

namespace brainforge {

auto event_blob_key(const RunId &run_id, std::int64_t event_id)
    -> std::string {
  return std::format("events/{}/{}.json", run_id, event_id);
}

auto EventLog::append(Event &event) -> task<Result<void>> {
  auto body = serialize_event(event);
  const auto type = event.type();

  if (body.size() <= threshold_) {
    auto id = co_await events_->insert_event(event.run_id, type,
                                             std::move(body), std::nullopt);
    if (!id) {
      log::error("Failed to append {} event for run {}: {}",
                 to_string_view(type), event.run_id, id.error().message());
      co_return fail(id.error());
    }
    event.event_id = *id;
    co_return ok();
  }

  // Reserve the row first: the blob key embeds the assigned id.
  auto id = co_await events_->insert_event(
      event.run_id, type, std::nullopt, std::string(storage::kPendingBlobKey));
  if (!id) {
    co_return fail(id.error());
  }
  auto key = event_blob_key(event.run_id, *id);
  log::debug("Event {} of run {} is {} bytes, overflowing to {}", *id,
             event.run_id, body.size(), key);

  if (auto put = co_await blobs_->put(key, std::move(body)); !put) {
    log::error("Failed to store overflow blob {}: {}", key,
               put.error().message());
    co_return fail(put.error());
  }
  if (auto upd = co_await events_->update_blob_key(event.run_id, *id, key);
      !upd) {
    co_return fail(upd.error());
  }
  event.event_id = *id;
  co_return ok();
}

auto EventLoader::fetch_blob(std::string key) -> task<Result<std::string>> {
  if (key == storage::kPendingBlobKey) {
    log::error("Blob not found for key: {}. Cannot reconstruct run state.",
               key);
    co_return fail(Error::BlobMissing);
  }
  auto body = co_await blobs_->get(key);
  if (!body) {
    co_return fail(body.error());
  }
  if (!*body) {
    log::error("Blob not found for key: {}. Cannot reconstruct run state.",
               key);
    co_return fail(Error::BlobMissing);
  }
  co_return ok(std::move(**body));
}

auto EventLoader::hydrate(const storage::EventRow &row)
    -> task<Result<std::optional<Event>>> {
  std::string text;
  if (row.serialized_event) {
    text = *row.serialized_event;
  } else if (row.blob_key) {
    auto body = co_await fetch_blob(*row.blob_key);
    if (!body) {
      co_return fail(body.error());
    }
    text = std::move(*body);
  } else {
    log::warn("Event {} has neither a body nor a blob key, skipping",
              row.event_id);
    co_return ok(std::optional<Event>{});
  }

  auto event = deserialize_event(text);
  if (!event) {
    log::error("Event {} could not be decoded", row.event_id);
    co_return fail(event.error());
  }
  event->event_id = row.event_id;
  co_return ok(std::optional<Event>{std::move(*event)});
}

auto EventLoader::load_all_events(const RunId &run_id)
    -> task<Result<std::vector<Event>>> {
  auto rows = co_await events_->load_rows(run_id);
  if (!rows) {
    co_return fail(rows.error());
  }

  std::vector<task<Result<std::optional<Event>>>> pending;
  pending.reserve(rows->size());
  for (const auto &row : *rows) {
    pending.push_back(hydrate(row));
  }
  auto hydrated = co_await when_all(std::move(pending));

  std::vector<Event> events;
  events.reserve(hydrated.size());
  for (auto &item : hydrated) {
    if (!item) {
      co_return fail(item.error());
    }
    if (*item) {
      events.push_back(std::move(**item));
    }
  }
  co_return ok(std::move(events));
}

auto EventLoader::load_event_by_type(const RunId &run_id, EventType type,
                                     storage::EventOrder order)
    -> task<Result<std::optional<Event>>> {
  auto row = co_await events_->load_row_by_type(run_id, type, order);
  if (!row) {
    co_return fail(row.error());
  }
  if (!*row) {
    co_return ok(std::optional<Event>{});
  }
  co_return co_await hydrate(**row);
}

} // namespace brainforge
