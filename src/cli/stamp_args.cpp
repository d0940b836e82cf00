#include "cli/stamp_args.hpp"

#include <charconv>
#include <system_error>
#include <iostream>
#include <string_view>

namespace gitstamp::cli {

std::optional<StampArgs> parse_stamp_args(int argc, char **argv, StampFlags accepted) {
  const std::string cmd = argc > 0 ? argv[0] : "gitstamp";
  StampArgs args;
  bool have_path = false;

  auto fail = [&](const std::string &why) -> std::optional<StampArgs> {
    std::cerr << cmd << ": " << why << "\n";
    return std::nullopt;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    const bool has_value = i + 1 < argc;

    if (accepted.version && a == "--suffix") {
      if (!has_value)
        return fail("--suffix needs a value");
      args.version.suffix = argv[++i];
    } else if (accepted.version && a == "--abbrev") {
      if (!has_value)
        return fail("--abbrev needs a value");
      const std::string_view v = argv[++i];
      std::size_t n = 0;
      const auto [end, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      if (ec != std::errc{} || end != v.data() + v.size() || n < consts::kMinAbbrev ||
          n > consts::kOidHexLen)
        return fail("--abbrev expects a number between 4 and 40");
      args.version.abbrev = n;
    } else if (accepted.untracked && a == "--no-untracked") {
      args.version.include_untracked = false;
    } else if (accepted.emit && a == "--format") {
      if (!has_value)
        return fail("--format needs a value");
      args.format = parse_format(argv[++i]);
      if (!args.format)
        return fail(std::string("unknown format '") + argv[i] + "'");
    } else if (accepted.emit && a == "--prefix") {
      if (!has_value)
        return fail("--prefix needs a value");
      args.prefix = argv[++i];
    } else if (accepted.emit && (a == "--output" || a == "-o")) {
      if (!has_value)
        return fail("--output needs a value");
      args.output = std::filesystem::path{argv[++i]};
    } else if (a.starts_with("-")) {
      return fail("unknown option " + std::string(a));
    } else if (have_path) {
      return fail("more than one path given");
    } else {
      args.path = std::filesystem::path{a};
      have_path = true;
    }
  }
  if (!have_path) {
    std::error_code ec;
    args.path = std::filesystem::current_path(ec);
    if (ec)
      return fail("cannot determine the current directory: " + ec.message());
  }
  return args;
}

} // namespace gitstamp::cli
