#include "errors.h"

#include <cerrno>

#include <fmt/format.h>

namespace fileman {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::PermissionDenied:
    return "PermissionDenied";
  case ErrorKind::NotADirectory:
    return "NotADirectory";
  case ErrorKind::MoveFailed:
    return "MoveFailed";
  }
  return "Unknown";
}

ErrorKind ClassifyError(const std::error_code &ec, ErrorKind fallback) {
  if (ec.category() != std::generic_category() &&
      ec.category() != std::system_category()) {
    return fallback;
  }
  switch (ec.value()) {
  case ENOENT:
    return ErrorKind::NotFound;
  case EACCES:
  case EPERM:
  case EROFS:
    return ErrorKind::PermissionDenied;
  case ENOTDIR:
    return ErrorKind::NotADirectory;
  default:
    return fallback;
  }
}

OrganizeError::OrganizeError(ErrorKind kind, std::filesystem::path path,
                             const std::string &message)
    : std::runtime_error(
          fmt::format("{}: {}: {}", ToString(kind), path.native(), message)),
      kind_(kind), path_(std::move(path)) {}

} // namespace fileman
