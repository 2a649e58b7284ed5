#pragma once

#include "aoa/orchestrator/task.hpp"

#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace aoa::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kDim = "\033[2m";

inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}

inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}

inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}

inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto outcome_label(const TaskReport &report) -> std::string {
  if (!report.dispatched)
    return ansi::dim("not run");
  switch (report.outcome) {
  case TaskOutcome::Success:
    return ansi::green("merged");
  case TaskOutcome::NoChange:
    return ansi::yellow("no change");
  case TaskOutcome::Failure:
    return ansi::red("failed");
  }
  return std::string(to_string_view(report.outcome));
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      if (col.right_align) {
        std::print("{:>{}}", col.header, col.width);
      } else {
        std::print("{:<{}}", col.header, col.width);
      }
    }
    std::println("");

    std::size_t total_width = 0;
    for (const auto &col : columns_)
      total_width += col.width;
    total_width += columns_.size() - 1;
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < col.width ? col.width - visible : 0;
      if (col.right_align) {
        std::print("{}{}", std::string(pad, ' '), val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

inline auto format_elapsed(std::chrono::milliseconds elapsed) -> std::string {
  const auto ms = elapsed.count();
  if (ms <= 0)
    return "-";
  auto dur = ms / 1000;
  if (dur < 1)
    return std::format("{}ms", ms);
  if (dur < 60)
    return std::format("{}s", dur);
  if (dur < 3600)
    return std::format("{}m {}s", dur / 60, dur % 60);
  return std::format("{}h {}m", dur / 3600, (dur % 3600) / 60);
}

} // namespace aoa::cli::fmt
