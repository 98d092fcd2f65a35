#include "organizer.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>
#include <system_error>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fileman {

namespace {

// Cross-device fallback. `mv -n` copies and unlinks, keeping timestamps, and
// never replaces an existing destination.
void MoveSubprocess(const std::filesystem::path &file,
                    const std::filesystem::path &destination) {
  std::string arg0 = "mv";
  std::string arg1 = "-n";
  std::string arg2 = "--";
  std::string arg3 = file.native();
  std::string arg4 = destination.native();
  std::array<char *, 6> argv = {arg0.data(), arg1.data(), arg2.data(),
                                arg3.data(), arg4.data(), nullptr};
  pid_t pid;
  int error = posix_spawnp(&pid, "mv", nullptr, nullptr, argv.data(), environ);
  if (error) {
    throw OrganizeError(ErrorKind::MoveFailed, file,
                        std::string("move subprocess: ") + strerror(error));
  }
  int stat;
  while (waitpid(pid, &stat, 0) < 0) {
    if (errno != EINTR) {
      throw OrganizeError(ErrorKind::MoveFailed, file,
                          std::string("waitpid: ") + strerror(errno));
    }
  }
  if (!WIFEXITED(stat)) {
    throw OrganizeError(ErrorKind::MoveFailed, file,
                        "move subprocess terminated abnormally");
  }
  if (WEXITSTATUS(stat) != 0) {
    throw OrganizeError(
        ErrorKind::MoveFailed, file,
        fmt::format("move exit status: {}", WEXITSTATUS(stat)));
  }
  std::error_code ec;
  if (std::filesystem::exists(std::filesystem::symlink_status(file, ec))) {
    throw OrganizeError(ErrorKind::MoveFailed, file,
                        "file still present after move");
  }
}

void EnsureDirectory(const std::filesystem::path &file,
                     const std::filesystem::path &directory) {
  std::error_code ec;
  std::filesystem::file_status status = std::filesystem::status(directory, ec);
  if (std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      throw OrganizeError(ErrorKind::NotADirectory, file,
                          "not a directory: " + directory.native());
    }
    return;
  }
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    // create_directories reports EEXIST when an intermediate component is a
    // regular file.
    ErrorKind kind = ec == std::errc::file_exists
                         ? ErrorKind::NotADirectory
                         : ClassifyError(ec, ErrorKind::MoveFailed);
    throw OrganizeError(kind, file,
                        fmt::format("unable to create directory {}: {}",
                                    directory.native(), ec.message()));
  }
}

MoveOutcome PrepareMove(const FileEntry &entry,
                        const std::filesystem::path &target) {
  std::filesystem::path destination;
  try {
    destination = DestinationFor(entry.modified, target);
  } catch (const std::out_of_range &e) {
    throw OrganizeError(ErrorKind::MoveFailed, entry.path, e.what());
  }
  spdlog::debug("Planned {} -> {}", entry.path.native(),
                destination.native());
  EnsureDirectory(entry.path, destination);
  return Move(entry.path, destination);
}

} // namespace

std::filesystem::path
DestinationFor(std::chrono::system_clock::time_point time,
               const std::filesystem::path &target) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  if (localtime_r(&seconds, &tm) == nullptr) {
    throw std::out_of_range(
        fmt::format("timestamp {} has no calendar date", seconds));
  }
  return target / fmt::format("{:04}", tm.tm_year + 1900) /
         fmt::format("{:02}", tm.tm_mon + 1);
}

MoveOutcome Move(const std::filesystem::path &file,
                 const std::filesystem::path &directory) {
  const std::filesystem::path destination = directory / file.filename();
  std::error_code ec;
  if (std::filesystem::exists(
          std::filesystem::symlink_status(destination, ec))) {
    if (std::filesystem::equivalent(file, destination, ec)) {
      return MoveOutcome::InPlace;
    }
    return MoveOutcome::Skipped;
  }
  std::filesystem::rename(file, destination, ec);
  if (!ec) {
    return MoveOutcome::Moved;
  }
  if (ec.value() == EXDEV) {
    MoveSubprocess(file, destination);
    return MoveOutcome::Moved;
  }
  throw OrganizeError(ClassifyError(ec, ErrorKind::MoveFailed), file,
                      ec.message());
}

OrganizeReport OrganizeDirectory(const std::filesystem::path &source,
                                 const std::filesystem::path &target) {
  RequireDirectory(source);

  std::error_code ec;
  std::filesystem::file_status target_status =
      std::filesystem::status(target, ec);
  if (std::filesystem::exists(target_status)) {
    if (!std::filesystem::is_directory(target_status)) {
      throw OrganizeError(ErrorKind::NotADirectory, target, "not a directory");
    }
  } else {
    std::filesystem::create_directories(target, ec);
    if (ec) {
      throw OrganizeError(ClassifyError(ec, ErrorKind::MoveFailed), target,
                          ec.message());
    }
  }

  ScanResult scan = CollectFiles(source, target);
  OrganizeReport report;
  report.failures = std::move(scan.failures);
  spdlog::info("Found {} files in {}", scan.files.size(), source.native());

  for (const FileEntry &entry : scan.files) {
    try {
      switch (PrepareMove(entry, target)) {
      case MoveOutcome::Moved:
        ++report.moved;
        spdlog::info("Moved {}", entry.path.native());
        break;
      case MoveOutcome::Skipped:
        report.skipped.push_back(entry.path);
        spdlog::warn("Skipped {}: destination already exists",
                     entry.path.native());
        break;
      case MoveOutcome::InPlace:
        spdlog::debug("{} is already in place", entry.path.native());
        break;
      }
    } catch (const OrganizeError &e) {
      spdlog::error("{}", e.what());
      report.failures.push_back({entry.path, e.kind(), e.what()});
    }
  }
  return report;
}

} // namespace fileman
