#pragma once

#include <algorithm>
#include <cctype>
#include <span>
#include <string>
#include <string_view>

namespace aoa {

/// Truncate a string for log preview (max 80 chars).
[[nodiscard]] inline auto preview(std::string_view text) -> std::string {
  if (text.size() <= 80)
    return std::string(text);
  return std::string(text.substr(0, 80)) + "...";
}

[[nodiscard]] inline auto trim_whitespace(std::string_view text)
    -> std::string_view {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

/// POSIX single-quote escaping: the result is always read back by a shell
/// as exactly one word, whatever `arg` contains.
[[nodiscard]] inline auto shell_quote(std::string_view arg) -> std::string {
  const bool plain =
      !arg.empty() && std::ranges::all_of(arg, [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.' ||
               c == '/' || c == '=' || c == ':' || c == ',' || c == '@' ||
               c == '+';
      });
  if (plain) {
    return std::string(arg);
  }
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (char c : arg) {
    if (c == '\'') {
      out.append("'\\''");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

[[nodiscard]] inline auto join_command_line(std::string_view program,
                                            std::span<const std::string> args)
    -> std::string {
  std::string line = shell_quote(program);
  for (const auto &arg : args) {
    line.push_back(' ');
    line.append(shell_quote(arg));
  }
  return line;
}

} // namespace aoa
