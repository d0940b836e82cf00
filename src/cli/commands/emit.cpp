#include "cli/stamp_args.hpp"

#include "gitstamp/repo.hpp"
#include "gitstamp/stamp.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

// Header macro prefixes must form valid identifiers
static bool is_identifier(const std::string &s) {
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front())))
    return false;
  return std::ranges::all_of(
      s, [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
}

int cmd_emit(int argc, char **argv) {
  const auto args = gitstamp::cli::parse_stamp_args(
      argc, argv, {.version = true, .untracked = true, .emit = true});
  if (!args || !args->format || !is_identifier(args->prefix)) {
    if (args && !args->format)
      std::cerr << "emit: --format is required\n";
    else if (args)
      std::cerr << "emit: invalid macro prefix '" << args->prefix << "'\n";
    std::cerr << "usage: gitstamp emit --format text|properties|header [--prefix P] "
                 "[--output FILE] [--suffix S] [--abbrev N] [--no-untracked] [path]\n";
    return 2;
  }

  try {
    const auto repo =
        gitstamp::Repository::open(args->path, gitstamp::RepositoryOptions::from_environment());
    const auto stamp = gitstamp::compute_stamp(repo, args->version);
    const std::string text = gitstamp::render_stamp(stamp, *args->format, args->prefix);

    if (!args->output) {
      std::cout << text;
      return 0;
    }
    if (gitstamp::write_stamp_file(*args->output, text))
      std::cerr << "emit: wrote " << args->output->string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "emit: " << e.what() << "\n";
    return 1;
  }
}
