#pragma once
#include "gitstamp/stamp.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace gitstamp::cli {

// Flags shared by the commands that compute a stamp
struct StampArgs {
  VersionOptions version;
  std::optional<StampFormat> format;
  std::string prefix = "BUILD";
  std::optional<std::filesystem::path> output;
  std::filesystem::path path; // current directory when none is given
};

// Which flags a command accepts besides [path]
struct StampFlags {
  bool version = false; // --suffix, --abbrev
  bool untracked = false; // --no-untracked
  bool emit = false;    // --format, --prefix, --output
};

// Parse argv (argv[0] is the command name). On a usage error, including an
// unreadable current directory, prints "<command>: <reason>" and returns nullopt.
std::optional<StampArgs> parse_stamp_args(int argc, char **argv, StampFlags accepted);

} // namespace gitstamp::cli
