#pragma once

#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace brainforge::storage {

/// Bulk storage for overflowed events and generated pages.
class BlobStore {
public:
  virtual ~BlobStore() = default;

  [[nodiscard]] virtual auto put(std::string key, std::string body)
      -> task<Result<void>> = 0;
  /// nullopt when the key does not exist.
  [[nodiscard]] virtual auto get(std::string key)
      -> task<Result<std::optional<std::string>>> = 0;
  [[nodiscard]] virtual auto remove(std::string key) -> task<Result<void>> = 0;
};

} // namespace brainforge::storage
