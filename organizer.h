#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

#include "scanner.h"

namespace fileman {

struct OrganizeReport {
  std::size_t moved = 0;
  // Files left in place because the destination already held that name.
  std::vector<std::filesystem::path> skipped;
  std::vector<FileFailure> failures;

  bool ok() const { return failures.empty(); }
};

enum class MoveOutcome {
  Moved,
  Skipped,
  // The file already is its own destination.
  InPlace,
};

// target/YYYY/MM for `time` in local time. Throws std::out_of_range when
// `time` has no calendar representation.
std::filesystem::path
DestinationFor(std::chrono::system_clock::time_point time,
               const std::filesystem::path &target);

// Moves `file` to `directory`/<filename>, keeping an existing destination
// file untouched. Throws OrganizeError when the move fails, in which case
// `file` is still in place.
MoveOutcome Move(const std::filesystem::path &file,
                 const std::filesystem::path &directory);

// Moves every regular file under `source` into the year/month hierarchy
// under `target`. Fatal problems with either root throw OrganizeError;
// per-file problems are collected into the report and the run continues.
OrganizeReport OrganizeDirectory(const std::filesystem::path &source,
                                 const std::filesystem::path &target);

} // namespace fileman
