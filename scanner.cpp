#include "scanner.h"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fileman {

namespace {

std::filesystem::directory_iterator OpenDirectory(
    const std::filesystem::path &directory) {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    throw OrganizeError(ClassifyError(ec, ErrorKind::NotFound), directory,
                        ec.message());
  }
  return it;
}

void Walk(const std::filesystem::path &directory,
          const std::filesystem::path &exclude, ScanResult &result) {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  const std::filesystem::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    ScanEntry(*it, exclude, result);
  }
  if (ec) {
    spdlog::warn("Cannot read {}: {}", directory.native(), ec.message());
    result.failures.push_back(
        {directory, ClassifyError(ec, ErrorKind::PermissionDenied),
         ec.message()});
  }
}

} // namespace

void ScanEntry(const std::filesystem::directory_entry &entry,
               const std::filesystem::path &exclude, ScanResult &result) {
  std::error_code ec;
  std::filesystem::file_status status = entry.symlink_status(ec);
  if (ec) {
    spdlog::warn("Cannot stat {}: {}", entry.path().native(), ec.message());
    result.failures.push_back({entry.path(),
                               ClassifyError(ec, ErrorKind::MoveFailed),
                               ec.message()});
    return;
  }

  switch (status.type()) {
  case std::filesystem::file_type::symlink:
    spdlog::debug("Skipping symlink {}", entry.path().native());
    return;
  case std::filesystem::file_type::directory:
    if (!exclude.empty() &&
        std::filesystem::weakly_canonical(entry.path(), ec) == exclude) {
      spdlog::debug("Skipping target directory {}", entry.path().native());
      return;
    }
    Walk(entry.path(), exclude, result);
    return;
  case std::filesystem::file_type::regular:
    break;
  default:
    return;
  }

  std::filesystem::file_time_type time = entry.last_write_time(ec);
  if (ec) {
    result.failures.push_back({entry.path(),
                               ClassifyError(ec, ErrorKind::MoveFailed),
                               ec.message()});
    return;
  }
  result.files.push_back({entry.path(), ToSystemTime(time)});
}

void RequireDirectory(const std::filesystem::path &directory) {
  std::error_code ec;
  std::filesystem::file_status status =
      std::filesystem::status(directory, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw OrganizeError(ClassifyError(ec, ErrorKind::NotFound), directory,
                        ec.message());
  }
  if (!std::filesystem::exists(status)) {
    throw OrganizeError(ErrorKind::NotFound, directory, "no such directory");
  }
  if (!std::filesystem::is_directory(status)) {
    throw OrganizeError(ErrorKind::NotADirectory, directory,
                        "not a directory");
  }
  OpenDirectory(directory);
}

ScanResult CollectFiles(const std::filesystem::path &source,
                        const std::filesystem::path &exclude) {
  RequireDirectory(source);

  std::filesystem::path canonical_exclude;
  if (!exclude.empty()) {
    std::error_code ec;
    canonical_exclude = std::filesystem::weakly_canonical(exclude, ec);
    if (ec) {
      canonical_exclude = std::filesystem::absolute(exclude).lexically_normal();
    }
  }

  ScanResult result;
  Walk(source, canonical_exclude, result);
  std::sort(result.files.begin(), result.files.end(),
            [](const FileEntry &a, const FileEntry &b) {
              return a.path < b.path;
            });
  return result;
}

std::size_t CountFiles(const std::filesystem::path &directory) {
  RequireDirectory(directory);
  std::size_t count = 0;
  for (std::filesystem::directory_iterator it = OpenDirectory(directory),
                                           end;
       it != end; ++it) {
    std::error_code ec;
    if (it->is_regular_file(ec)) {
      ++count;
    }
  }
  return count;
}

std::chrono::system_clock::time_point
ToSystemTime(std::filesystem::file_time_type time) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(time));
}

} // namespace fileman
