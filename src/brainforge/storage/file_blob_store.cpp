#include "brainforge/storage/file_blob_store.hpp"

#include "brainforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace brainforge::storage {

FileBlobStore::FileBlobStore(std::filesystem::path root, std::size_t threads)
    : root_(std::move(root)), io_pool_(std::max<std::size_t>(1, threads)) {}

FileBlobStore::~FileBlobStore() {
  io_pool_.stop();
  io_pool_.join();
}

auto FileBlobStore::path_for(std::string_view key) const
    -> Result<std::filesystem::path> {
  const std::filesystem::path relative{key};
  if (key.empty() || relative.is_absolute()) {
    return fail(Error::InvalidArgument);
  }
  for (const auto &part : relative) {
    if (part == "..") {
      return fail(Error::InvalidArgument);
    }
  }
  return root_ / relative;
}

auto FileBlobStore::put(std::string key, std::string body)
    -> task<Result<void>> {
  auto path = path_for(key);
  if (!path) {
    co_return fail(path.error());
  }
  co_return co_await boost::asio::co_spawn(
      io_pool_.get_executor(),
      [target = std::move(*path),
       body = std::move(body)]() -> task<Result<void>> {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
          log::error("Failed to create blob directory {}: {}",
                     target.parent_path().string(), ec.message());
          co_return fail(ec);
        }
        // Write beside the target and rename so readers never see a torn
        // blob.
        auto tmp = target;
        tmp += ".tmp";
        {
          std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
          if (!out) {
            co_return fail(Error::FileNotFound);
          }
          out.write(body.data(), static_cast<std::streamsize>(body.size()));
          if (!out) {
            co_return fail(Error::Unknown);
          }
        }
        std::filesystem::rename(tmp, target, ec);
        if (ec) {
          co_return fail(ec);
        }
        co_return ok();
      },
      boost::asio::use_awaitable);
}

auto FileBlobStore::get(std::string key)
    -> task<Result<std::optional<std::string>>> {
  auto path = path_for(key);
  if (!path) {
    co_return fail(path.error());
  }
  co_return co_await boost::asio::co_spawn(
      io_pool_.get_executor(),
      [target = std::move(*path)]()
          -> task<Result<std::optional<std::string>>> {
        std::ifstream in(target, std::ios::binary);
        if (!in) {
          co_return std::optional<std::string>{};
        }
        std::string body{std::istreambuf_iterator<char>(in),
                         std::istreambuf_iterator<char>()};
        co_return std::optional<std::string>{std::move(body)};
      },
      boost::asio::use_awaitable);
}

auto FileBlobStore::remove(std::string key) -> task<Result<void>> {
  auto path = path_for(key);
  if (!path) {
    co_return fail(path.error());
  }
  co_return co_await boost::asio::co_spawn(
      io_pool_.get_executor(),
      [target = std::move(*path)]() -> task<Result<void>> {
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec) {
          co_return fail(ec);
        }
        co_return ok();
      },
      boost::asio::use_awaitable);
}

} // namespace brainforge::storage
