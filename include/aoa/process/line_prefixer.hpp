#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace aoa {

inline constexpr std::size_t kMaxPendingLine = 64UZ * 1024;

/// Splits a byte stream that arrives in arbitrary chunks into lines and
/// hands each complete line, prefixed with the tag, to the sink. A trailing
/// partial line is emitted by flush(). Output with no newline (progress
/// bars) is cut into lines of at most `max_line` bytes.
class LinePrefixer {
public:
  using Sink = std::move_only_function<void(std::string_view line)>;

  LinePrefixer(std::string tag, Sink sink,
               std::size_t max_line = kMaxPendingLine)
      : tag_(std::move(tag)), sink_(std::move(sink)),
        max_line_(std::max<std::size_t>(max_line, 1)) {}

  auto feed(std::string_view chunk) -> void {
    while (!chunk.empty()) {
      const auto room = max_line_ - pending_.size();
      const auto nl = chunk.substr(0, room + 1).find('\n');
      if (nl != std::string_view::npos) {
        pending_.append(chunk.substr(0, nl));
        emit();
        chunk.remove_prefix(nl + 1);
      } else if (chunk.size() <= room) {
        pending_.append(chunk);
        return;
      } else {
        pending_.append(chunk.substr(0, room));
        emit();
        chunk.remove_prefix(room);
      }
    }
  }

  auto flush() -> void {
    if (!pending_.empty()) {
      emit();
    }
  }

private:
  auto emit() -> void {
    if (!pending_.empty() && pending_.back() == '\r') {
      pending_.pop_back();
    }
    std::string line;
    line.reserve(tag_.size() + pending_.size() + 2);
    line.append(tag_);
    line.push_back(' ');
    line.append(pending_);
    line.push_back('\n');
    sink_(line);
    pending_.clear();
  }

  std::string tag_;
  Sink sink_;
  std::size_t max_line_;
  std::string pending_;
};

} // namespace aoa
