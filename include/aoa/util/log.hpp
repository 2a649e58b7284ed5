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
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace aoa::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

inline constexpr std::string_view kColorReset = "\o{33}[0m";

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Thread-local buffer to reduce allocation
struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() noexcept { buffer.reserve(1024); }
};

inline thread_local ThreadBuffer t_buffer;

// Every record is a complete line (or a batch of complete lines) so that
// output of concurrent workers never interleaves inside a line.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t kMaxBatch = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_messages_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  [[nodiscard]] auto current_output() const noexcept -> FILE * {
    auto *out = output_.load(std::memory_order_acquire);
    return out ? out : stdout;
  }

  [[nodiscard]] auto use_color() const noexcept -> bool {
    auto *out = current_output();
    return file_ == nullptr && ::isatty(::fileno(out)) != 0;
  }

  auto write_direct(std::string_view text) -> void {
    auto *out = current_output();
    std::fwrite(text.data(), 1, text.size(), out);
    std::fflush(out);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(kMaxBatch);

    while (running_.load(std::memory_order_acquire)) {
      std::optional<std::string> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });

      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }
      batch.clear();
      batch.push_back(std::move(*first));

      while (batch.size() < kMaxBatch) {
        std::optional<std::string> msg;
        if (!queue->try_receive(
                [&](const boost::system::error_code &try_ec, std::string item) {
                  if (!try_ec) {
                    msg = std::move(item);
                  }
                })) {
          break;
        }
        if (msg) {
          batch.push_back(std::move(*msg));
        }
      }

      auto *out = current_output();
      for (const auto &msg : batch) {
        std::fwrite(msg.data(), 1, msg.size(), out);
      }
      std::fflush(out);
    }

    // Drain whatever is still buffered after stop() closed the channel.
    auto *out = current_output();
    for (;;) {
      std::optional<std::string> msg;
      if (!queue->try_receive(
              [&](const boost::system::error_code &ec, std::string item) {
                if (!ec) {
                  msg = std::move(item);
                }
              })) {
        break;
      }
      if (msg) {
        std::fwrite(msg->data(), 1, msg->size(), out);
      }
    }
    std::fflush(out);
  }

  // `lossless` records are written synchronously when the channel is full.
  // One fwrite per record keeps them whole next to the writer thread's.
  auto submit(std::string text, bool lossless = false) -> void {
    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, text)) {
      return;
    }
    if (queue && !lossless && ::isatty(::fileno(current_output())) == 0) {
      // Never block a worker on a full pipe; count the loss instead.
      dropped_messages_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    write_direct(text);
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
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    queue_ctx_.restart();
    auto channel =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), QUEUE_CAPACITY);
    queue_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (queue) {
      // Wakes a pending receive with an error; buffered records stay
      // readable for the writer's final drain.
      queue->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
    if (auto lost = dropped_messages_.exchange(0, std::memory_order_relaxed);
        lost > 0) {
      log(Level::Warn, "{} log record(s) dropped while output was backed up",
          lost);
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_messages_.load(std::memory_order_relaxed);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  auto set_output_stdout() noexcept -> void {
    output_.store(stdout, std::memory_order_release);
  }

  // Must be called before start().
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_)
      std::fclose(file_);
    file_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const bool color = use_color();

    auto &buf = t_buffer.buffer;
    buf.clear();
    std::format_to(std::back_inserter(buf), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   time, color ? level_color(level) : "", level_name(level),
                   color ? kColorReset : "", tid);
    std::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    buf.push_back('\n');
    submit(buf);
  }

  /// Emit pre-formatted text verbatim (no timestamp, no level filter).
  /// Never dropped: this carries agent output.
  auto raw(std::string_view text) -> void {
    submit(std::string(text), true);
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

inline auto set_output_stdout() noexcept -> void {
  logger().set_output_stdout();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

inline auto raw(std::string_view text) -> void { logger().raw(text); }

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

} // namespace aoa::log
