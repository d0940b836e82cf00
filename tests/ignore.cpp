#include "gitstamp/ignore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

struct GlobCase {
  const char *pattern;
  const char *text;
  bool expected;
};

int main() {
  const GlobCase globs[] = {
      {"*.o", "main.o", true},
      {"*.o", "main.c", false},
      {"*.o", "dir/main.o", false}, // '*' never crosses '/'
      {"?.txt", "a.txt", true},
      {"?.txt", "ab.txt", false},
      {"[abc].txt", "b.txt", true},
      {"[!abc].txt", "b.txt", false},
      {"[a-c]x", "cx", true},
      {"[[:digit:]]*", "7up", true},
      {"[[:digit:]]*", "up", false},
      {"**/build", "build", true},
      {"**/build", "a/b/build", true},
      {"docs/**", "docs/x/y.md", true},
      {"a/**/b", "a/b", true},
      {"a/**/b", "a/x/y/b", true},
      {"a/**/b", "a/x/c", false},
      {"\\*literal", "*literal", true},
      {"\\*literal", "xliteral", false},
  };
  for (const auto &[pattern, text, expected] : globs) {
    if (gitstamp::wildmatch(pattern, text) != expected) {
      std::cerr << "wildmatch(" << pattern << ", " << text << ") != " << expected << "\n";
      return 1;
    }
  }

  // Line parsing
  {
    gitstamp::IgnorePattern p;
    if (gitstamp::parse_ignore_line("# comment", p) || gitstamp::parse_ignore_line("", p)) {
      std::cerr << "comment or blank parsed as a pattern\n";
      return 1;
    }
    if (!gitstamp::parse_ignore_line("!/out/  ", p) || !p.negated || !p.dir_only ||
        !p.anchored || p.glob != "out") {
      std::cerr << "'!/out/  ' misparsed: [" << p.glob << "]\n";
      return 1;
    }
    if (!gitstamp::parse_ignore_line("\\#hash", p) || p.glob != "#hash" || p.negated) {
      std::cerr << "escaped '#' misparsed\n";
      return 1;
    }
    if (!gitstamp::parse_ignore_line("trail\\ ", p) || p.glob != "trail\\ ") {
      std::cerr << "escaped trailing space dropped\n";
      return 1;
    }
  }

  const fs::path root =
      fs::temp_directory_path() / ("gitstamp_ignore_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    write_file(root / "exclude", "*.tmp\n");
    write_file(root / "w" / ".gitignore", "*.log\nbuild/\n/top.txt\n");
    write_file(root / "w" / "sub" / ".gitignore", "!keep.log\n");

    gitstamp::IgnoreRules rules;
    rules.add_global_file(root / "exclude");
    rules.add_global_file(root / "missing-file"); // absent sources are fine
    rules.push_directory(root / "w", "");

    const auto check = [&](std::string_view path, bool is_dir, bool expected) {
      if (rules.is_ignored(path, is_dir) != expected) {
        std::cerr << "is_ignored(" << path << ", " << is_dir << ") != " << expected << "\n";
        return false;
      }
      return true;
    };

    if (!check("a.tmp", false, true) || !check("a.log", false, true) ||
        !check("src/a.log", false, true) || !check("build", true, true) ||
        !check("build", false, false) || !check("top.txt", false, true) ||
        !check("sub/top.txt", false, false) || !check("a.txt", false, false))
      return 1;

    // Deeper .gitignore re-includes
    rules.push_directory(root / "w" / "sub", "sub");
    if (!check("sub/keep.log", false, false) || !check("sub/other.log", false, true))
      return 1;
    rules.pop_directory();
    if (!check("sub/keep.log", false, true))
      return 1;

    std::cout << "ignore OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
