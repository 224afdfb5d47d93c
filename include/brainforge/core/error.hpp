#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace brainforge {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  SystemNotRunning,
  InvalidState,
  InvalidPatch,
  PatchPathNotFound,
  PatchTestFailed,
  BlobMissing,
  CorruptEventLog,
  StepFailed,
  ModelFailed,
  Unauthorized,
  HandlerFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 23> messages = {
      "success",
      "file not found",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "system not running",
      "invalid state transition",
      "malformed JSON patch",
      "JSON patch path not found",
      "JSON patch test failed",
      "blob missing, cannot reconstruct run state",
      "corrupt event log",
      "step failed",
      "model call failed",
      "unauthorized",
      "webhook handler failed",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "brainforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

/// True for errors that mean the event log can no longer be replayed.
[[nodiscard]] inline auto is_replay_fatal(const std::error_code &ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::InvalidPatch:
  case Error::PatchPathNotFound:
  case Error::PatchTestFailed:
  case Error::BlobMissing:
  case Error::CorruptEventLog:
    return true;
  default:
    return false;
  }
}

} // namespace brainforge

template <>
struct std::is_error_code_enum<brainforge::Error> : std::true_type {};
