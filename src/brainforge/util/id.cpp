#include "brainforge/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace brainforge::detail {

namespace {
auto engine() -> std::mt19937_64 & {
  thread_local std::mt19937_64 gen(std::random_device{}());
  return gen;
}
} // namespace

auto generate_uuid_v7_like() -> std::string {
  std::uniform_int_distribution<std::uint64_t> dis;
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  return std::format("{:012x}{:016x}", now_ms, dis(engine()));
}

// Tokens leave the process, so they come straight from the OS entropy source.
auto generate_random_hex(std::size_t bytes) -> std::string {
  std::random_device rd;
  std::string out;
  out.reserve(bytes * 2);
  for (std::size_t i = 0; i < bytes; ++i) {
    out += std::format("{:02x}", rd() & 0xffU);
  }
  return out;
}

} // namespace brainforge::detail
