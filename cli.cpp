#include "cli.h"

#include <cstdlib>
#include <exception>
#include <filesystem>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "config.h"
#include "errors.h"
#include "organizer.h"
#include "scanner.h"

namespace fileman {

namespace {

constexpr std::string_view kUsage = "usage: fileman organize <source> <target>\n"
                                    "       fileman count <directory>";

int RunOrganize(const Config &config) {
  OrganizeReport report = OrganizeDirectory(config.source, config.target);
  fmt::print("moved {}, skipped {}, failed {}\n", report.moved,
             report.skipped.size(), report.failures.size());
  return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int RunCount(const Config &config) {
  fmt::print("{}\n", CountFiles(config.source));
  return EXIT_SUCCESS;
}

} // namespace

int Run(std::span<const std::string_view> args) {
  Config config;
  try {
    config = ParseConfig(args);
  } catch (const ConfigError &e) {
    spdlog::error("Error in configuration: {}", e.what());
    fmt::print(stderr, "{}\n", kUsage);
    return EXIT_FAILURE;
  }

  try {
    switch (config.task) {
    case Task::Organize:
      return RunOrganize(config);
    case Task::Count:
      return RunCount(config);
    }
  } catch (const OrganizeError &e) {
    spdlog::error("{}", e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    spdlog::error("{}", e.what());
  } catch (const std::exception &e) {
    spdlog::error("Unexpected error: {}", e.what());
  }
  return EXIT_FAILURE;
}

} // namespace fileman
