#pragma once

#include "brainforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>

namespace brainforge {

enum class RunStatus : std::uint8_t {
  Pending,
  Running,
  Paused,
  Waiting,
  Complete,
  Error,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(RunStatus, Pending, Running, Paused, Waiting, Complete,
                    Error, Cancelled)
BRAINFORGE_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(RunStatus status) noexcept -> bool {
  return status == RunStatus::Complete || status == RunStatus::Error ||
         status == RunStatus::Cancelled;
}

} // namespace brainforge
