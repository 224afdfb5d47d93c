#pragma once

#include "brainforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace brainforge {

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"brainforge"};
  std::string password{"brainforge"};
  std::string database{"brainforge"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct EngineConfig {
  std::string log_level{"info"};
  std::string log_file;
  int shards{0}; // 0 = auto (hardware_concurrency)
  int max_parallel_tools{4};

  auto operator==(const EngineConfig &) const -> bool = default;
};

enum class StorageBackend : std::uint8_t { Memory, Mysql };
BOOST_DESCRIBE_ENUM(StorageBackend, Memory, Mysql)
BRAINFORGE_DEFINE_ENUM_SERDE(StorageBackend, StorageBackend::Memory)

enum class BlobBackend : std::uint8_t { Memory, Filesystem };
BOOST_DESCRIBE_ENUM(BlobBackend, Memory, Filesystem)
BRAINFORGE_DEFINE_ENUM_SERDE(BlobBackend, BlobBackend::Memory)

inline constexpr std::size_t kDefaultOverflowThreshold = 1048576;

struct StorageConfig {
  StorageBackend backend{StorageBackend::Memory};
  BlobBackend blob_backend{BlobBackend::Memory};
  std::string blob_directory{"./blobs"};
  std::size_t overflow_threshold_bytes{kDefaultOverflowThreshold};

  auto operator==(const StorageConfig &) const -> bool = default;
};

struct ApiConfig {
  bool enabled{true};
  uint16_t port{8080};
  std::string host{"127.0.0.1"};

  auto operator==(const ApiConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  EngineConfig engine;
  StorageConfig storage;
  ApiConfig api;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace brainforge
