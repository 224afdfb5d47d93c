#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/config/system_config.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/storage/blob_store.hpp"
#include "brainforge/storage/event_store.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace brainforge {

/// Blob key of an overflowed event body.
[[nodiscard]] auto event_blob_key(const RunId &run_id, std::int64_t event_id)
    -> std::string;

/// Append side of the event log. Bodies larger than the overflow threshold go
/// to the blob store and the row keeps only the key.
class EventLog {
public:
  EventLog(storage::EventStore &events, storage::BlobStore &blobs,
           std::size_t overflow_threshold = kDefaultOverflowThreshold)
      : events_(&events), blobs_(&blobs), threshold_(overflow_threshold) {}

  /// Persists `event` and writes the assigned id back into it.
  [[nodiscard]] auto append(Event &event) -> task<Result<void>>;

  [[nodiscard]] auto overflow_threshold() const noexcept -> std::size_t {
    return threshold_;
  }

private:
  storage::EventStore *events_;
  storage::BlobStore *blobs_;
  std::size_t threshold_;
};

/// Read side of the event log.
class EventLoader {
public:
  EventLoader(storage::EventStore &events, storage::BlobStore &blobs)
      : events_(&events), blobs_(&blobs) {}

  /// Every event of the run in log order. Overflowed bodies are fetched
  /// concurrently.
  [[nodiscard]] auto load_all_events(const RunId &run_id)
      -> task<Result<std::vector<Event>>>;

  /// First (Ascending) or last (Descending) event of `type`.
  [[nodiscard]] auto load_event_by_type(const RunId &run_id, EventType type,
                                        storage::EventOrder order)
      -> task<Result<std::optional<Event>>>;

private:
  [[nodiscard]] auto fetch_blob(std::string key)
      -> task<Result<std::string>>;
  [[nodiscard]] auto hydrate(const storage::EventRow &row)
      -> task<Result<std::optional<Event>>>;

  storage::EventStore *events_;
  storage::BlobStore *blobs_;
};

} // namespace brainforge
