#include "errors.h"

#include <cerrno>

#include <gtest/gtest.h>

namespace fileman {
namespace {

TEST(ClassifyErrorTest, MapsErrnoValues) {
  EXPECT_EQ(ClassifyError(std::error_code(ENOENT, std::generic_category()),
                          ErrorKind::MoveFailed),
            ErrorKind::NotFound);
  EXPECT_EQ(ClassifyError(std::error_code(EACCES, std::generic_category()),
                          ErrorKind::MoveFailed),
            ErrorKind::PermissionDenied);
  EXPECT_EQ(ClassifyError(std::error_code(EPERM, std::system_category()),
                          ErrorKind::MoveFailed),
            ErrorKind::PermissionDenied);
  EXPECT_EQ(ClassifyError(std::error_code(EROFS, std::generic_category()),
                          ErrorKind::MoveFailed),
            ErrorKind::PermissionDenied);
  EXPECT_EQ(ClassifyError(std::error_code(ENOTDIR, std::generic_category()),
                          ErrorKind::MoveFailed),
            ErrorKind::NotADirectory);
}

TEST(ClassifyErrorTest, FallsBackForOtherErrors) {
  EXPECT_EQ(ClassifyError(std::error_code(EXDEV, std::generic_category()),
                          ErrorKind::MoveFailed),
            ErrorKind::MoveFailed);
  EXPECT_EQ(ClassifyError(std::error_code(ENOSPC, std::generic_category()),
                          ErrorKind::NotFound),
            ErrorKind::NotFound);
}

TEST(OrganizeErrorTest, MessageNamesKindAndPath) {
  OrganizeError error(ErrorKind::MoveFailed, "/tmp/a.txt", "boom");
  EXPECT_EQ(error.kind(), ErrorKind::MoveFailed);
  EXPECT_EQ(error.path(), std::filesystem::path("/tmp/a.txt"));
  EXPECT_STREQ(error.what(), "MoveFailed: /tmp/a.txt: boom");
}

} // namespace
} // namespace fileman
