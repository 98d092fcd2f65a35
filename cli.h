#pragma once

#include <span>
#include <string_view>

namespace fileman {

// Runs the task named on the command line (without the program name) and
// returns the process exit code. The organize summary goes to stdout, usage
// and errors to stderr.
int Run(std::span<const std::string_view> args);

} // namespace fileman
