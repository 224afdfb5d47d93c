#pragma once

#include "brainforge/storage/blob_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <filesystem>

namespace brainforge::storage {

/// Blobs as files under a root directory. Keys map to relative paths; file
/// I/O runs on a private thread pool so shard threads never block on disk.
class FileBlobStore final : public BlobStore {
public:
  explicit FileBlobStore(std::filesystem::path root, std::size_t threads = 2);
  ~FileBlobStore() override;

  FileBlobStore(const FileBlobStore &) = delete;
  FileBlobStore &operator=(const FileBlobStore &) = delete;

  auto put(std::string key, std::string body) -> task<Result<void>> override;
  auto get(std::string key)
      -> task<Result<std::optional<std::string>>> override;
  auto remove(std::string key) -> task<Result<void>> override;

  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path & {
    return root_;
  }

  /// InvalidArgument for absolute keys or keys escaping the root.
  [[nodiscard]] auto path_for(std::string_view key) const
      -> Result<std::filesystem::path>;

private:
  std::filesystem::path root_;
  boost::asio::thread_pool io_pool_;
};

} // namespace brainforge::storage
