#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "errors.h"

namespace fileman {

// Snapshot of one regular file, taken when the source tree is scanned.
struct FileEntry {
  std::filesystem::path path;
  std::chrono::system_clock::time_point modified;
};

struct FileFailure {
  std::filesystem::path path;
  ErrorKind kind;
  std::string message;
};

struct ScanResult {
  std::vector<FileEntry> files;
  std::vector<FileFailure> failures;
};

// Throws OrganizeError unless `directory` exists, is a directory and can be
// listed.
void RequireDirectory(const std::filesystem::path &directory);

// Recursively collects regular files under `source`, sorted by path.
// Symlinks are neither followed nor collected, and the subtree rooted at
// `exclude` is skipped. Throws OrganizeError if `source` itself cannot be
// listed; unreadable nested directories end up in ScanResult::failures.
ScanResult CollectFiles(const std::filesystem::path &source,
                        const std::filesystem::path &exclude);

// Adds one directory entry to `result`: regular files are collected,
// directories other than `exclude` are walked, symlinks and special files are
// ignored. An entry whose type cannot be read is recorded as a failure.
void ScanEntry(const std::filesystem::directory_entry &entry,
               const std::filesystem::path &exclude, ScanResult &result);

// Number of regular files directly inside `directory`.
std::size_t CountFiles(const std::filesystem::path &directory);

std::chrono::system_clock::time_point
ToSystemTime(std::filesystem::file_time_type time);

} // namespace fileman
