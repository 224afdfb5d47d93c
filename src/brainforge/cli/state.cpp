#include "brainforge/brain/event_codec.hpp"
#include "brainforge/cli/commands.hpp"
#include "brainforge/config/config.hpp"
#include "brainforge/engine/event_log.hpp"
#include "brainforge/engine/state_reconstructor.hpp"
#include "brainforge/storage/file_blob_store.hpp"
#include "brainforge/storage/memory_store.hpp"
#include "brainforge/storage/mysql_database.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <memory>
#include <print>

namespace brainforge::cli {

namespace {

auto print_events(const std::vector<Event> &events) -> void {
  for (const auto &event : events) {
    std::println("{:>5}  {:<22} {}", event.event_id,
                 to_string_view(event.type()), serialize_event(event));
  }
}

auto replay(storage::MySQLDatabase &db, storage::BlobStore &blobs,
            const StateOptions &opts) -> task<int> {
  if (auto r = co_await db.open(); !r) {
    std::println(stderr, "Error: cannot open database: {}", r.error().message());
    co_return 1;
  }

  EventLoader loader(db, blobs);
  auto events = co_await loader.load_all_events(RunId{opts.run_id});
  co_await db.close();
  if (!events) {
    std::println(stderr, "Error: {}", events.error().message());
    co_return 1;
  }
  if (events->empty()) {
    std::println(stderr, "Error: run '{}' not found", opts.run_id);
    co_return 1;
  }

  if (opts.events) {
    print_events(*events);
    co_return 0;
  }

  const auto index = opts.at.value_or(
      static_cast<std::int64_t>(events->size()) - 1);
  auto state = reconstruct_state_at_event(*events, index);
  if (!state) {
    std::println(stderr, "Error: replay failed: {}", state.error().message());
    co_return 1;
  }
  std::println("{}", dump_json(*state));
  co_return 0;
}

} // namespace

auto cmd_state(const StateOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  const auto &config = *config_res;

  if (config.storage.backend != StorageBackend::Mysql) {
    std::println(stderr,
                 "Error: offline replay needs a persistent event store "
                 "(storage.backend = \"mysql\")");
    return 1;
  }

  std::unique_ptr<storage::BlobStore> blobs;
  if (config.storage.blob_backend == BlobBackend::Filesystem) {
    blobs = std::make_unique<storage::FileBlobStore>(
        config.storage.blob_directory, 1);
  } else {
    // Overflowed bodies are unreachable; hydration reports BlobMissing.
    blobs = std::make_unique<storage::MemoryBlobStore>();
  }

  boost::asio::io_context io;
  storage::MySQLDatabase db(io.get_executor(), config.database);
  auto fut = boost::asio::co_spawn(io, replay(db, *blobs, opts),
                                   boost::asio::use_future);
  io.run();
  return fut.get();
}

} // namespace brainforge::cli
