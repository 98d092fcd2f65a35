#include <cstdlib>
#include <exception>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "cli.h"
#include "logging.h"

int main(int argc, char **argv) {
  try {
    fileman::InitLogging();
  } catch (const std::exception &e) {
    fmt::print(stderr, "unable to set up logging: {}\n", e.what());
    return EXIT_FAILURE;
  }

  std::vector<std::string_view> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return fileman::Run(args);
}
