#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

#include <fmt/format.h>
#include <grp.h>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fileman::testing {

// Fresh directory under the system temp dir, removed when the test ends.
class ScratchDir {
public:
  ScratchDir() {
    const ::testing::TestInfo *info =
        ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = std::filesystem::temp_directory_path() /
            fmt::format("fileman_{}_{}_{}", info->test_suite_name(),
                        info->name(), getpid());
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    // Restore write access in case a test locked a directory down.
    for (auto it = std::filesystem::recursive_directory_iterator(path_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
      std::error_code perm_ec;
      if (it->is_directory(perm_ec)) {
        std::filesystem::permissions(it->path(),
                                     std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add,
                                     perm_ec);
      }
    }
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path &path,
                      const std::string &content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

inline std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// Local wall-clock time, so the expected year/month holds in any timezone.
inline std::chrono::system_clock::time_point LocalTime(int year, int month,
                                                       int day, int hour = 12) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

inline void SetModified(const std::filesystem::path &path,
                        std::chrono::system_clock::time_point time) {
  std::filesystem::last_write_time(
      path, std::chrono::file_clock::from_sys(time));
}

// Grants other users read access to everything under `root`, so a check run
// as an unprivileged user can reach the fixture files.
inline void ShareWithOtherUsers(const std::filesystem::path &root) {
  const auto dir_perms = std::filesystem::perms::others_read |
                         std::filesystem::perms::others_exec;
  std::filesystem::permissions(root, dir_perms,
                               std::filesystem::perm_options::add);
  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(root)) {
    std::filesystem::permissions(
        entry.path(),
        entry.is_directory() ? dir_perms
                             : std::filesystem::perms::others_read,
        std::filesystem::perm_options::add);
  }
}

[[noreturn]] inline void RunAsNobody(const std::function<void()> &check) {
  constexpr uid_t kNobody = 65534;
  if (setgroups(0, nullptr) != 0 || setgid(kNobody) != 0 ||
      setuid(kNobody) != 0) {
    std::_Exit(2);
  }
  check();
  std::exit(::testing::Test::HasFailure() ? 1 : 0);
}

// Root ignores permission bits, so under root `check` runs in a forked child
// that has switched to the nobody user.
inline void ExpectWithoutRootPrivileges(const std::function<void()> &check) {
  if (geteuid() != 0) {
    check();
    return;
  }
  EXPECT_EXIT(RunAsNobody(check), ::testing::ExitedWithCode(0), "");
}

} // namespace fileman::testing
