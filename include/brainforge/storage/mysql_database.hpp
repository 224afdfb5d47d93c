#pragma once

#include "brainforge/config/system_config.hpp"
#include "brainforge/storage/event_store.hpp"
#include "brainforge/storage/monitor_store.hpp"
#include "brainforge/storage/signal_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

namespace brainforge::storage {

/// Event log, signal queue and monitor registry on MySQL 8 through a
/// Boost.MySQL connection pool.
class MySQLDatabase final : public EventStore,
                            public SignalStore,
                            public MonitorStore {
public:
  explicit MySQLDatabase(boost::asio::any_io_executor executor,
                         const DatabaseConfig &config);
  ~MySQLDatabase() override;

  MySQLDatabase(const MySQLDatabase &) = delete;
  MySQLDatabase &operator=(const MySQLDatabase &) = delete;

  [[nodiscard]] auto open() -> task<Result<void>>;
  auto close() -> task<void>;
  [[nodiscard]] auto is_open() const noexcept -> bool;

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

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto get_connection() -> task<Result<boost::mysql::pooled_connection>>;
  auto ensure_schema(boost::mysql::any_connection &conn) -> task<Result<void>>;

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  bool open_{false};
};

} // namespace brainforge::storage
