#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

namespace brainforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

struct Record {
  Level level{Level::Info};
  std::chrono::system_clock::time_point time;
  std::size_t thread_tag{0};
  std::string text;
};

/// Switch the sink. An empty path means stdout.
struct Redirect {
  std::string path;
};

using Message = std::variant<Record, Redirect>;

[[nodiscard]] inline auto format_record(const Record &r, bool color)
    -> std::string {
  const auto ms = std::chrono::floor<std::chrono::milliseconds>(r.time);
  if (!color) {
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", ms,
                       level_name(r.level), r.thread_tag, r.text);
  }
  return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", ms,
                     level_colors.at(std::to_underlying(r.level)),
                     level_name(r.level), r.thread_tag, r.text);
}

// Async logger: producers push records into a concurrent_channel, one writer
// thread formats and writes them in batches.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Message)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto open_sink(const std::string &path) -> bool {
    if (path.empty()) {
      output_.store(stdout, std::memory_order_release);
      if (file_) {
        std::fclose(file_);
        file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  [[nodiscard]] auto sink() const noexcept -> FILE * {
    auto *out = output_.load(std::memory_order_acquire);
    return out ? out : stdout;
  }

  [[nodiscard]] static auto is_tty(FILE *out) noexcept -> bool {
    const int fd = out ? ::fileno(out) : -1;
    return fd >= 0 && ::isatty(fd) != 0;
  }

  auto write(const Message &msg) -> void {
    if (const auto *redirect = std::get_if<Redirect>(&msg)) {
      (void)open_sink(redirect->path);
      return;
    }
    auto *out = sink();
    auto line = format_record(std::get<Record>(msg), is_tty(out));
    std::fwrite(line.data(), 1, line.size(), out);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<Message> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, Message item) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(item));
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec) {
        break;
      }

      while (batch.size() < kBatchSize &&
             queue->try_receive(
                 [&](const boost::system::error_code &ec, Message item) {
                   if (!ec) {
                     batch.push_back(std::move(item));
                   }
                 })) {
      }

      for (const auto &msg : batch) {
        write(msg);
      }
      std::fflush(sink());
    }

    for (;;) {
      std::optional<Message> msg;
      if (!queue->try_receive(
              [&](const boost::system::error_code &ec, Message item) {
                if (!ec) {
                  msg = std::move(item);
                }
              })) {
        break;
      }
      if (msg) {
        write(*msg);
      }
    }
    std::fflush(sink());
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto channel =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
    queue_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel]() mutable { writer_loop(std::move(channel)); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      queue->close();
    }
    queue_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  auto set_output_file(std::string_view path) -> bool {
    if (auto q = queue_.load(std::memory_order_acquire)) {
      return q->try_send(boost::system::error_code{},
                         Message{Redirect{std::string(path)}});
    }
    return open_sink(std::string(path));
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    Record record{
        .level = level,
        .time = std::chrono::system_clock::now(),
        .thread_tag =
            std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000,
        .text = std::format(fmt, std::forward<Args>(args)...),
    };

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue) {
      if (queue->try_send(boost::system::error_code{}, Message{record})) {
        return;
      }
      // Never block runtime threads on a full queue when nobody watches.
      if (!is_tty(sink())) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
      }
    }
    auto *out = sink();
    auto line = format_record(record, is_tty(out));
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace brainforge::log
