#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitstamp {

// Glob match with gitignore semantics: `*` and `?` never match '/',
// `**` between slashes spans any number of directories, `[...]` classes.
bool wildmatch(std::string_view pattern, std::string_view text);

struct IgnorePattern {
  std::string glob;       // pattern with the `!`, leading `/` and trailing `/` removed
  bool negated = false;   // "!pattern" re-includes
  bool dir_only = false;  // "pattern/" matches directories only
  bool anchored = false;  // contains a '/': matched against the full relative path
};

// Parse one line of an ignore file; false for blanks and comments.
bool parse_ignore_line(std::string_view line, IgnorePattern &out);

// Stack of ignore files for a directory walk. Global sources sit at the bottom;
// each directory entered pushes its own .gitignore.
class IgnoreRules {
public:
  // core.excludesFile, then $GIT_DIR/info/exclude (later files take precedence)
  void add_global_file(const std::filesystem::path &file);

  // `rel_dir` is repo-relative ("" for the root) and must nest inside the current top.
  void push_directory(const std::filesystem::path &abs_dir, const std::string &rel_dir);
  void pop_directory();

  // `rel_path` is repo-relative with '/' separators.
  [[nodiscard]] bool is_ignored(std::string_view rel_path, bool is_dir) const;

private:
  struct Frame {
    std::string base; // repo-relative directory of the ignore file, "" at the root
    std::vector<IgnorePattern> patterns;
  };

  static std::vector<IgnorePattern> read_patterns(const std::filesystem::path &file);

  std::vector<Frame> globals_;
  std::vector<Frame> frames_; // root .gitignore first
};

} // namespace gitstamp
