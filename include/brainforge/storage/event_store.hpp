#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace brainforge::storage {

/// One log row. Exactly one of `serialized_event` / `blob_key` is expected;
/// a blob key of "pending" marks an overflow upload still in flight.
struct EventRow {
  std::int64_t event_id{0};
  EventType event_type{EventType::Start};
  std::optional<std::string> serialized_event;
  std::optional<std::string> blob_key;
};

enum class EventOrder : std::uint8_t { Ascending, Descending };

inline constexpr std::string_view kPendingBlobKey = "pending";

class EventStore {
public:
  virtual ~EventStore() = default;

  /// Returns the assigned event id. Ids grow monotonically per run.
  [[nodiscard]] virtual auto
  insert_event(const RunId &run_id, EventType type,
               std::optional<std::string> serialized_event,
               std::optional<std::string> blob_key)
      -> task<Result<std::int64_t>> = 0;

  [[nodiscard]] virtual auto update_blob_key(const RunId &run_id,
                                             std::int64_t event_id,
                                             std::string blob_key)
      -> task<Result<void>> = 0;

  /// Rows ordered by event id.
  [[nodiscard]] virtual auto load_rows(const RunId &run_id)
      -> task<Result<std::vector<EventRow>>> = 0;

  /// First (Ascending) or last (Descending) row of a type.
  [[nodiscard]] virtual auto load_row_by_type(const RunId &run_id,
                                              EventType type, EventOrder order)
      -> task<Result<std::optional<EventRow>>> = 0;
};

} // namespace brainforge::storage
