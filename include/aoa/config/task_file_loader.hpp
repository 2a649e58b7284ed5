#pragma once

#include "aoa/core/error.hpp"
#include "aoa/orchestrator/task.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace aoa {

/// Reads the task list. A `.json` file holds an array of strings; any other
/// file has one task per line, where blank lines and `#` comments are
/// skipped. Tasks are numbered from zero in file order.
class TaskFileLoader {
public:
  [[nodiscard]] static auto load(const std::filesystem::path &path)
      -> Result<std::vector<Task>>;
  [[nodiscard]] static auto parse_json(std::string_view text)
      -> Result<std::vector<Task>>;
  [[nodiscard]] static auto parse_lines(std::string_view text)
      -> std::vector<Task>;
};

} // namespace aoa
