#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fileman {

enum class ErrorKind {
  NotFound,
  PermissionDenied,
  NotADirectory,
  MoveFailed,
};

std::string_view ToString(ErrorKind kind);

// Maps an OS error onto an ErrorKind. Errors without a dedicated kind map to
// `fallback`.
ErrorKind ClassifyError(const std::error_code &ec, ErrorKind fallback);

class OrganizeError : public std::runtime_error {
public:
  OrganizeError(ErrorKind kind, std::filesystem::path path,
                const std::string &message);

  ErrorKind kind() const { return kind_; }
  const std::filesystem::path &path() const { return path_; }

private:
  ErrorKind kind_;
  std::filesystem::path path_;
};

class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace fileman
