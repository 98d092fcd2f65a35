#include "config.h"

#include <algorithm>
#include <cctype>
#include <string>

#include <fmt/format.h>

#include "errors.h"

namespace fileman {

namespace {

std::string ToLower(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::filesystem::path RequirePath(std::span<const std::string_view> args,
                                  std::size_t index, std::string_view name) {
  if (index >= args.size()) {
    throw ConfigError(fmt::format("no '{}' path provided", name));
  }
  return std::filesystem::path(args[index]);
}

} // namespace

Config ParseConfig(std::span<const std::string_view> args) {
  if (args.empty()) {
    throw ConfigError("no task specified");
  }

  Config config;
  std::size_t consumed;
  const std::string task = ToLower(args[0]);
  if (task == "organize") {
    config.task = Task::Organize;
    config.source = RequirePath(args, 1, "source");
    config.target = RequirePath(args, 2, "target");
    consumed = 3;
  } else if (task == "count") {
    config.task = Task::Count;
    config.source = RequirePath(args, 1, "directory");
    consumed = 2;
  } else {
    throw ConfigError("provided task did not match any defined tasks");
  }

  if (args.size() > consumed) {
    throw ConfigError(fmt::format("unexpected argument `{}`", args[consumed]));
  }
  return config;
}

} // namespace fileman
