#include "brainforge/config/config.hpp"
#include "brainforge/config/toml_util.hpp"

#include "brainforge/core/error.hpp"
#include "brainforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace brainforge {
namespace detail {

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"brainforge"};
  std::string password;
  std::string database{"brainforge"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5};
};

struct EngineToml {
  std::string log_level{"info"};
  std::string log_file;
  int shards{0};
  int max_parallel_tools{4};
};

struct StorageToml {
  std::string backend{"memory"};
  std::string blob_backend{"memory"};
  std::string blob_directory{"./blobs"};
  std::int64_t overflow_threshold_bytes{
      static_cast<std::int64_t>(kDefaultOverflowThreshold)};
};

struct ApiToml {
  bool enabled{true};
  uint16_t port{8080};
  std::string host{"127.0.0.1"};
};

struct SystemToml {
  DatabaseToml database{};
  EngineToml engine{};
  StorageToml storage{};
  ApiToml api{};
};

} // namespace detail
} // namespace brainforge

namespace glz {
template <> struct meta<brainforge::detail::DatabaseToml> {
  using T = brainforge::detail::DatabaseToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<brainforge::detail::EngineToml> {
  using T = brainforge::detail::EngineToml;
  static constexpr auto value =
      object("log_level", &T::log_level, "log_file", &T::log_file, "shards",
             &T::shards, "max_parallel_tools", &T::max_parallel_tools);
};

template <> struct meta<brainforge::detail::StorageToml> {
  using T = brainforge::detail::StorageToml;
  static constexpr auto value =
      object("backend", &T::backend, "blob_backend", &T::blob_backend,
             "blob_directory", &T::blob_directory, "overflow_threshold_bytes",
             &T::overflow_threshold_bytes);
};

template <> struct meta<brainforge::detail::ApiToml> {
  using T = brainforge::detail::ApiToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "port", &T::port, "host", &T::host);
};

template <> struct meta<brainforge::detail::SystemToml> {
  using T = brainforge::detail::SystemToml;
  static constexpr auto value =
      object("database", &T::database, "engine", &T::engine, "storage",
             &T::storage, "api", &T::api);
};
} // namespace glz

namespace brainforge {
namespace {

[[nodiscard]] auto env(const char *name) -> const char * {
  return std::getenv(name);
}

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true";
}

auto apply_env_overrides(detail::SystemToml &raw) -> void {
  if (const char *v = env("BRAINFORGE_DB_HOST"); v != nullptr) {
    raw.database.host = v;
  }
  if (const char *v = env("BRAINFORGE_DB_PORT"); v != nullptr) {
    raw.database.port = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = env("BRAINFORGE_DB_USERNAME"); v != nullptr) {
    raw.database.username = v;
  }
  if (const char *v = env("BRAINFORGE_DB_PASSWORD"); v != nullptr) {
    raw.database.password = v;
  }
  if (const char *v = env("BRAINFORGE_DB_DATABASE"); v != nullptr) {
    raw.database.database = v;
  }
  if (const char *v = env("BRAINFORGE_DB_POOL_SIZE"); v != nullptr) {
    raw.database.pool_size = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = env("BRAINFORGE_DB_CONNECT_TIMEOUT"); v != nullptr) {
    raw.database.connect_timeout = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = env("BRAINFORGE_LOG_LEVEL"); v != nullptr) {
    raw.engine.log_level = v;
  }
  if (const char *v = env("BRAINFORGE_LOG_FILE"); v != nullptr) {
    raw.engine.log_file = v;
  }
  if (const char *v = env("BRAINFORGE_ENGINE_SHARDS"); v != nullptr) {
    raw.engine.shards = boost::lexical_cast<int>(v);
  }
  if (const char *v = env("BRAINFORGE_MAX_PARALLEL_TOOLS"); v != nullptr) {
    raw.engine.max_parallel_tools = boost::lexical_cast<int>(v);
  }
  if (const char *v = env("BRAINFORGE_STORAGE_BACKEND"); v != nullptr) {
    raw.storage.backend = v;
  }
  if (const char *v = env("BRAINFORGE_BLOB_BACKEND"); v != nullptr) {
    raw.storage.blob_backend = v;
  }
  if (const char *v = env("BRAINFORGE_BLOB_DIRECTORY"); v != nullptr) {
    raw.storage.blob_directory = v;
  }
  if (const char *v = env("BRAINFORGE_OVERFLOW_THRESHOLD_BYTES");
      v != nullptr) {
    raw.storage.overflow_threshold_bytes = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = env("BRAINFORGE_API_ENABLED"); v != nullptr) {
    raw.api.enabled = env_flag(v);
  }
  if (const char *v = env("BRAINFORGE_API_HOST"); v != nullptr) {
    raw.api.host = v;
  }
  if (const char *v = env("BRAINFORGE_API_PORT"); v != nullptr) {
    raw.api.port = boost::lexical_cast<uint16_t>(v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;
  apply_env_overrides(raw);

  auto backend = util::try_parse_enum<StorageBackend>(raw.storage.backend);
  auto blob_backend = util::try_parse_enum<BlobBackend>(raw.storage.blob_backend);
  if (!backend || !blob_backend) {
    log::error("Unknown storage backend '{}' / '{}'", raw.storage.backend,
               raw.storage.blob_backend);
    return fail(Error::ParseError);
  }
  if (!log::parse_level(raw.engine.log_level)) {
    log::error("Unknown log level '{}'", raw.engine.log_level);
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.database.host = std::move(raw.database.host);
  cfg.database.port = raw.database.port;
  cfg.database.username = std::move(raw.database.username);
  cfg.database.password = std::move(raw.database.password);
  cfg.database.database = std::move(raw.database.database);
  cfg.database.pool_size = raw.database.pool_size;
  cfg.database.connect_timeout = raw.database.connect_timeout;

  cfg.engine.log_level = std::move(raw.engine.log_level);
  cfg.engine.log_file = std::move(raw.engine.log_file);
  cfg.engine.shards = raw.engine.shards;
  cfg.engine.max_parallel_tools = raw.engine.max_parallel_tools;

  cfg.storage.backend = *backend;
  cfg.storage.blob_backend = *blob_backend;
  cfg.storage.blob_directory = std::move(raw.storage.blob_directory);

  cfg.api.enabled = raw.api.enabled;
  cfg.api.host = std::move(raw.api.host);
  cfg.api.port = raw.api.port;

  if (cfg.engine.shards < 0 || cfg.engine.max_parallel_tools <= 0 ||
      raw.storage.overflow_threshold_bytes <= 0 ||
      cfg.database.pool_size == 0 ||
      (cfg.storage.blob_backend == BlobBackend::Filesystem &&
       cfg.storage.blob_directory.empty())) {
    return fail(Error::ParseError);
  }
  cfg.storage.overflow_threshold_bytes =
      static_cast<std::size_t>(raw.storage.overflow_threshold_bytes);
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read configuration file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace brainforge
