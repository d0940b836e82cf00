#include "cli/stamp_args.hpp"

#include "gitstamp/stamp.hpp"

#include <iostream>

int cmd_version(int argc, char **argv) {
  const auto args = gitstamp::cli::parse_stamp_args(
      argc, argv, {.version = true, .untracked = true, .emit = false});
  if (!args) {
    std::cerr << "usage: gitstamp version [--suffix S] [--abbrev N] [--no-untracked] [path]\n";
    return 2;
  }

  try {
    std::cout << gitstamp::compute_version(args->path, args->version) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "version: " << e.what() << "\n";
    return 1;
  }
}
