#include "aoa/config/task_file_loader.hpp"
#include "aoa/config/toml_util.hpp"

#include "aoa/util/log.hpp"
#include "aoa/util/shell.hpp"

#include <string>

namespace aoa {

auto TaskFileLoader::load(const std::filesystem::path &path)
    -> Result<std::vector<Task>> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    log::error("task file not found: {}", path.string());
    return fail(Error::FileNotFound);
  }
  auto text = toml_util::read_file(path.string());
  if (!text) {
    return fail(text.error());
  }

  if (path.extension() == ".json") {
    auto tasks = parse_json(*text);
    if (tasks) {
      log::debug("loaded {} task(s) from {}", tasks->size(), path.string());
    }
    return tasks;
  }
  auto tasks = parse_lines(*text);
  log::debug("loaded {} task(s) from {}", tasks.size(), path.string());
  return ok(std::move(tasks));
}

auto TaskFileLoader::parse_json(std::string_view text)
    -> Result<std::vector<Task>> {
  auto raw = toml_util::parse_json<std::vector<std::string>>(text);
  if (!raw) {
    return fail(raw.error());
  }
  std::vector<Task> tasks;
  tasks.reserve(raw->size());
  for (auto &item : *raw) {
    tasks.push_back(Task{.index = tasks.size(), .text = std::move(item)});
  }
  return ok(std::move(tasks));
}

auto TaskFileLoader::parse_lines(std::string_view text) -> std::vector<Task> {
  std::vector<Task> tasks;
  while (!text.empty()) {
    const auto nl = text.find('\n');
    const auto line = trim_whitespace(text.substr(0, nl));
    text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    tasks.push_back(Task{.index = tasks.size(), .text = std::string(line)});
  }
  return tasks;
}

} // namespace aoa
