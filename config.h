#pragma once

#include <filesystem>
#include <span>
#include <string_view>

namespace fileman {

enum class Task {
  Organize,
  Count,
};

struct Config {
  Task task = Task::Organize;
  // organize: directory holding unorganized files; count: directory to count.
  std::filesystem::path source;
  // organize only.
  std::filesystem::path target;
};

// Parses the command line without the program name. Throws ConfigError.
Config ParseConfig(std::span<const std::string_view> args);

} // namespace fileman
