#include "brainforge/storage/mysql_database.hpp"

#include "brainforge/storage/mysql_schema.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/log.hpp"
#include "brainforge/util/time.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/sequence.hpp>
#include <boost/mysql/with_params.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace brainforge::storage {
namespace {

using boost::asio::use_awaitable;

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  current.reserve(input.size());

  auto flush = [&] {
    auto first = current.find_first_not_of(" \n\r\t");
    if (first != std::string::npos) {
      auto last = current.find_last_not_of(" \n\r\t");
      out.emplace_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };

  bool in_single = false;
  bool in_double = false;
  for (char c : input) {
    if (c == '\'' && !in_double) {
      in_single = !in_single;
    } else if (c == '"' && !in_single) {
      in_double = !in_double;
    }
    if (c == ';' && !in_single && !in_double) {
      flush();
      continue;
    }
    current.push_back(c);
  }
  flush();
  return out;
}

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = std::max<std::size_t>(1, cfg.pool_size);
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto as_i64(const boost::mysql::field_view &f) -> std::int64_t {
  if (f.is_int64()) {
    return f.as_int64();
  }
  if (f.is_uint64()) {
    return static_cast<std::int64_t>(f.as_uint64());
  }
  if (f.is_string()) {
    return std::stoll(std::string(f.as_string()));
  }
  return 0;
}

[[nodiscard]] auto as_sv(const boost::mysql::field_view &f)
    -> std::string_view {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string_view(s.data(), s.size());
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  return std::string(as_sv(f));
}

[[nodiscard]] auto as_opt_str(const boost::mysql::field_view &f)
    -> std::optional<std::string> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return as_str(f);
}

[[nodiscard]] auto kind_name(SignalKind kind) -> std::string_view {
  return kind == SignalKind::Control ? "control" : "webhook";
}

template <typename F>
auto mysql_try(F &&f) -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const std::exception &e) {
    log::error("MySQL operation failed: {}", e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

[[nodiscard]] auto to_event_row(const boost::mysql::row_view &row)
    -> Result<EventRow> {
  auto type = util::try_parse_enum<EventType>(as_sv(row.at(1)));
  if (!type) {
    log::error("Unknown event type '{}' in event {}", as_sv(row.at(1)),
               as_i64(row.at(0)));
    return fail(Error::CorruptEventLog);
  }
  return EventRow{.event_id = as_i64(row.at(0)),
                  .event_type = *type,
                  .serialized_event = as_opt_str(row.at(2)),
                  .blob_key = as_opt_str(row.at(3))};
}

[[nodiscard]] auto to_run_record(const boost::mysql::row_view &row)
    -> RunRecord {
  return RunRecord{
      .run_id = RunId{as_str(row.at(0))},
      .brain_title = as_str(row.at(1)),
      .status = parse<RunStatus>(as_sv(row.at(2))),
      .error = as_opt_str(row.at(3)),
      .created_at = as_i64(row.at(4)),
      .started_at = as_i64(row.at(5)),
      .completed_at = as_i64(row.at(6)),
  };
}

constexpr std::string_view kRunColumns =
    "run_id, brain_title, status, error, created_at, started_at, completed_at";

} // namespace

MySQLDatabase::MySQLDatabase(boost::asio::any_io_executor executor,
                             const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLDatabase::~MySQLDatabase() { pool_.cancel(); }

auto MySQLDatabase::ensure_database_exists() -> task<Result<void>> {
  std::string direct_connect_error;
  try {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.database = cfg_.database;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    direct_connect_error = e.what();
  }

  try {
    // First start: connect without a default schema and create it.
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                  cfg_.database),
        res, use_awaitable);
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error(
        "MySQL ensure database failed: direct_connect='{}', create_db='{}'",
        direct_connect_error, e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLDatabase::open() -> task<Result<void>> {
  if (open_) {
    co_return ok();
  }

  if (auto db_res = co_await ensure_database_exists(); !db_res) {
    co_return fail(db_res.error());
  }

  open_ = true;
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_ = false;
    co_return fail(conn_res.error());
  }
  if (auto schema_res = co_await ensure_schema(conn_res->get()); !schema_res) {
    open_ = false;
    co_return fail(schema_res.error());
  }
  conn_res->return_without_reset();

  log::info("MySQL database opened: {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
  co_return ok();
}

auto MySQLDatabase::close() -> task<void> {
  if (open_) {
    pool_.cancel();
    open_ = false;
  }
  co_return;
}

auto MySQLDatabase::is_open() const noexcept -> bool { return open_; }

auto MySQLDatabase::get_connection()
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!open_) {
    co_return fail(Error::SystemNotRunning);
  }
  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::error("MySQL get connection failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLDatabase::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::pipeline_request req;
    for (const auto &stmt : split_sql_statements(schema::V1_SCHEMA)) {
      req.add_execute(stmt);
    }
    req.add_execute("INSERT IGNORE INTO schema_version(version) VALUES (" +
                    std::to_string(schema::CURRENT_SCHEMA_VERSION) + ")");

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn.async_run_pipeline(req, stage_responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

// --- event log -------------------------------------------------------------

auto MySQLDatabase::insert_event(const RunId &run_id, EventType type,
                                 std::optional<std::string> serialized_event,
                                 std::optional<std::string> blob_key)
    -> task<Result<std::int64_t>> {
  co_return co_await mysql_try([&]() -> task<Result<std::int64_t>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO brain_events(run_id, event_type, serialized_event, "
            "blob_key, created_at) VALUES ({}, {}, {}, {}, {})",
            run_id.value(), to_string_view(type), serialized_event, blob_key,
            util::now_millis()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(static_cast<std::int64_t>(res.last_insert_id()));
  });
}

auto MySQLDatabase::update_blob_key(const RunId &run_id, std::int64_t event_id,
                                    std::string blob_key)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("UPDATE brain_events SET blob_key = {} "
                                  "WHERE run_id = {} AND event_id = {}",
                                  blob_key, run_id.value(), event_id),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.affected_rows() == 0) {
      co_return fail(Error::NotFound);
    }
    co_return ok();
  });
}

auto MySQLDatabase::load_rows(const RunId &run_id)
    -> task<Result<std::vector<EventRow>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<EventRow>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT event_id, event_type, serialized_event, blob_key "
            "FROM brain_events WHERE run_id = {} ORDER BY event_id ASC",
            run_id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<EventRow> rows;
    rows.reserve(res.rows().size());
    for (auto row : res.rows()) {
      auto decoded = to_event_row(row);
      if (!decoded) {
        co_return fail(decoded.error());
      }
      rows.push_back(std::move(*decoded));
    }
    co_return ok(std::move(rows));
  });
}

auto MySQLDatabase::load_row_by_type(const RunId &run_id, EventType type,
                                     EventOrder order)
    -> task<Result<std::optional<EventRow>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<EventRow>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        const std::string_view direction =
            order == EventOrder::Ascending ? "ASC" : "DESC";
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT event_id, event_type, serialized_event, blob_key "
                "FROM brain_events WHERE run_id = {} AND event_type = {} "
                "ORDER BY event_id {:r} LIMIT 1",
                run_id.value(), to_string_view(type), direction),
            res, use_awaitable);
        conn_res->return_without_reset();

        if (res.rows().empty()) {
          co_return ok(std::optional<EventRow>{});
        }
        auto decoded = to_event_row(res.rows().at(0));
        if (!decoded) {
          co_return fail(decoded.error());
        }
        co_return ok(std::optional<EventRow>{std::move(*decoded)});
      });
}

// --- signal queue ----------------------------------------------------------

auto MySQLDatabase::queue_signal(const RunId &run_id, Signal signal)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    std::optional<std::string> webhook_slug;
    std::optional<std::string> webhook_identifier;
    if (signal.webhook) {
      webhook_slug = signal.webhook->slug;
      webhook_identifier = signal.webhook->identifier;
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO brain_signals(run_id, signal_id, signal_type, kind, "
            "payload, webhook_slug, webhook_identifier, queued_at) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {})",
            run_id.value(), signal.id.value(), signal_type_name(signal.type),
            kind_name(signal.kind()), dump_json(signal.payload),
            webhook_slug, webhook_identifier,
            signal.queued_at),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLDatabase::get_and_consume_signals(const RunId &run_id,
                                            SignalFilter filter)
    -> task<Result<std::vector<Signal>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Signal>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results sel_res;
    if (filter == SignalFilter::All) {
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT signal_rowid, signal_id, signal_type, payload, queued_at, "
              "webhook_slug, webhook_identifier "
              "FROM brain_signals WHERE run_id = {} "
              "ORDER BY signal_rowid ASC FOR UPDATE",
              run_id.value()),
          sel_res, use_awaitable);
    } else {
      const auto kind = filter == SignalFilter::Control ? SignalKind::Control
                                                        : SignalKind::Webhook;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT signal_rowid, signal_id, signal_type, payload, queued_at, "
              "webhook_slug, webhook_identifier "
              "FROM brain_signals WHERE run_id = {} AND kind = {} "
              "ORDER BY signal_rowid ASC FOR UPDATE",
              run_id.value(), kind_name(kind)),
          sel_res, use_awaitable);
    }

    std::vector<Signal> signals;
    std::vector<std::int64_t> rowids;
    signals.reserve(sel_res.rows().size());
    rowids.reserve(sel_res.rows().size());
    for (auto row : sel_res.rows()) {
      rowids.push_back(as_i64(row.at(0)));
      auto type = parse_signal_type(as_sv(row.at(2)));
      if (!type) {
        log::warn("Dropping signal {} with unknown type '{}'",
                  as_sv(row.at(1)), as_sv(row.at(2)));
        continue;
      }
      auto payload = parse_json(as_sv(row.at(3)));
      if (!payload) {
        log::warn("Signal {} has an unreadable payload", as_sv(row.at(1)));
      }
      Signal signal{.id = SignalId{as_str(row.at(1))},
                    .type = *type,
                    .payload = payload ? std::move(*payload) : JsonValue{},
                    .queued_at = as_i64(row.at(4))};
      if (!row.at(5).is_null() && !row.at(6).is_null()) {
        signal.webhook = WebhookKey{.slug = as_str(row.at(5)),
                                    .identifier = as_str(row.at(6))};
      }
      signals.push_back(std::move(signal));
    }

    if (!rowids.empty()) {
      boost::mysql::results del_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "DELETE FROM brain_signals WHERE signal_rowid IN ({})",
              boost::mysql::sequence(std::cref(rowids))),
          del_res, use_awaitable);
    }

    boost::mysql::results commit_res;
    co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(std::move(signals));
  });
}

// --- monitor: waiting webhooks ---------------------------------------------

auto MySQLDatabase::register_waiting(std::string_view slug,
                                     std::string_view identifier,
                                     WaitingEntry entry) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO waiting_webhooks(slug, identifier, run_id, token, "
            "created_at) VALUES ({}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE run_id = VALUES(run_id), "
            "token = VALUES(token), created_at = VALUES(created_at)",
            slug, identifier, entry.run_id.value(), entry.token,
            util::now_millis()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLDatabase::find_waiting_run(std::string_view slug,
                                     std::string_view identifier)
    -> task<Result<std::optional<WaitingEntry>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<WaitingEntry>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT run_id, token FROM waiting_webhooks "
                "WHERE slug = {} AND identifier = {}",
                slug, identifier),
            res, use_awaitable);
        conn_res->return_without_reset();
        if (res.rows().empty()) {
          co_return ok(std::optional<WaitingEntry>{});
        }
        auto row = res.rows().at(0);
        co_return ok(std::optional<WaitingEntry>{WaitingEntry{
            .run_id = RunId{as_str(row.at(0))}, .token = as_opt_str(row.at(1))}});
      });
}

auto MySQLDatabase::take_waiting(std::string_view slug,
                                 std::string_view identifier,
                                 const RunId &run_id) -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "DELETE FROM waiting_webhooks "
            "WHERE slug = {} AND identifier = {} AND run_id = {}",
            slug, identifier, run_id.value()),
        res, use_awaitable);
    const bool claimed = res.affected_rows() == 1;
    if (claimed) {
      // One delivery answers the whole wait.
      boost::mysql::results rest_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "DELETE FROM waiting_webhooks WHERE run_id = {}", run_id.value()),
          rest_res, use_awaitable);
    }

    boost::mysql::results commit_res;
    co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(claimed);
  });
}

auto MySQLDatabase::clear_waiting(const RunId &run_id) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "DELETE FROM waiting_webhooks WHERE run_id = {}", run_id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

// --- monitor: runs ---------------------------------------------------------

auto MySQLDatabase::upsert_run(const RunRecord &record) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO brain_runs({:r}) VALUES ({}, {}, {}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE brain_title = VALUES(brain_title), "
            "status = VALUES(status), error = VALUES(error), "
            "started_at = VALUES(started_at), "
            "completed_at = VALUES(completed_at)",
            kRunColumns, record.run_id.value(), record.brain_title,
            to_string_view(record.status), record.error, record.created_at,
            record.started_at, record.completed_at),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLDatabase::get_run(const RunId &run_id)
    -> task<Result<std::optional<RunRecord>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::optional<RunRecord>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM brain_runs WHERE run_id = {}", kRunColumns,
            run_id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return ok(std::optional<RunRecord>{});
    }
    co_return ok(std::optional<RunRecord>{to_run_record(res.rows().at(0))});
  });
}

auto MySQLDatabase::list_runs(std::size_t limit)
    -> task<Result<std::vector<RunRecord>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<RunRecord>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM brain_runs ORDER BY created_at DESC LIMIT {}",
            kRunColumns, limit),
        res, use_awaitable);
    conn_res->return_without_reset();
    std::vector<RunRecord> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_run_record(row));
    }
    co_return ok(std::move(out));
  });
}

// --- monitor: webhook deadlines --------------------------------------------

auto MySQLDatabase::set_timeout(const RunId &run_id, std::int64_t deadline_ms)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO run_timeouts(run_id, deadline_ms) VALUES ({}, {}) "
            "ON DUPLICATE KEY UPDATE deadline_ms = VALUES(deadline_ms)",
            run_id.value(), deadline_ms),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLDatabase::get_timeout(const RunId &run_id)
    -> task<Result<std::optional<std::int64_t>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<std::int64_t>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT deadline_ms FROM run_timeouts WHERE run_id = {}",
                run_id.value()),
            res, use_awaitable);
        conn_res->return_without_reset();
        if (res.rows().empty()) {
          co_return ok(std::optional<std::int64_t>{});
        }
        co_return ok(std::optional<std::int64_t>{as_i64(res.rows().at(0).at(0))});
      });
}

auto MySQLDatabase::clear_timeout(const RunId &run_id) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("DELETE FROM run_timeouts WHERE run_id = {}",
                                  run_id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLDatabase::list_timeouts()
    -> task<Result<std::vector<TimeoutEntry>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<TimeoutEntry>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            "SELECT run_id, deadline_ms FROM run_timeouts", res,
            use_awaitable);
        conn_res->return_without_reset();
        std::vector<TimeoutEntry> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back({.run_id = RunId{as_str(row.at(0))},
                         .deadline_ms = as_i64(row.at(1))});
        }
        co_return ok(std::move(out));
      });
}

// --- monitor: pages --------------------------------------------------------

auto MySQLDatabase::register_page(PageRecord page) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO pages(slug, run_id, persist, created_at) "
            "VALUES ({}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE run_id = VALUES(run_id), "
            "persist = VALUES(persist)",
            page.slug, page.run_id.value(), page.persist ? 1 : 0,
            util::now_millis()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLDatabase::non_persistent_pages(const RunId &run_id)
    -> task<Result<std::vector<PageRecord>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<PageRecord>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT slug FROM pages WHERE run_id = {} AND persist = 0",
            run_id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    std::vector<PageRecord> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back({.slug = as_str(row.at(0)), .run_id = run_id});
    }
    co_return ok(std::move(out));
  });
}

auto MySQLDatabase::remove_page(std::string_view slug) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("DELETE FROM pages WHERE slug = {}", slug),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

} // namespace brainforge::storage
