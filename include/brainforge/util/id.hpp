#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace brainforge {

struct RunTag {};
struct SignalTag {};

// Phantom-typed string id, keeps run ids and signal ids apart at compile time.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using RunId = TypedId<RunTag>;
using SignalId = TypedId<SignalTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace brainforge

// `is_avalanching` makes ankerl::unordered_dense delegate to this hash.
template <typename Tag> struct std::hash<brainforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const brainforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<brainforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const brainforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace brainforge {

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
[[nodiscard]] auto generate_random_hex(std::size_t bytes) -> std::string;
} // namespace detail

inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

inline auto generate_signal_id() -> SignalId {
  return SignalId{detail::generate_uuid_v7_like()};
}

} // namespace brainforge
