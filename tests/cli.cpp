#include "cli/stamp_args.hpp"

#include "gitstamp/index.hpp"
#include "gitstamp/repo.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

int cmd_version(int, char **);
int cmd_head(int, char **);
int cmd_status(int, char **);
int cmd_emit(int, char **);

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static bool contains(const std::string &haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

// Redirects std::cout and std::cerr for the lifetime of the object
class Capture {
public:
  Capture() : old_out_(std::cout.rdbuf(out.rdbuf())), old_err_(std::cerr.rdbuf(err.rdbuf())) {}
  ~Capture() {
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
  }
  Capture(const Capture &) = delete;
  Capture &operator=(const Capture &) = delete;

  std::ostringstream out;
  std::ostringstream err;

private:
  std::streambuf *old_out_;
  std::streambuf *old_err_;
};

struct Outcome {
  int code = -1;
  std::string out;
  std::string err;
};

static Outcome run(int (*handler)(int, char **), std::vector<std::string> args) {
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);

  Outcome r;
  Capture cap;
  r.code = handler(static_cast<int>(args.size()), argv.data());
  r.out = cap.out.str();
  r.err = cap.err.str();
  return r;
}

static std::optional<gitstamp::cli::StampArgs> parse(std::vector<std::string> args,
                                                     gitstamp::cli::StampFlags flags) {
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);
  Capture cap;
  return gitstamp::cli::parse_stamp_args(static_cast<int>(args.size()), argv.data(), flags);
}

static bool check(const Outcome &r, int code, const char *what) {
  if (r.code == code)
    return true;
  std::cerr << what << ": exit " << r.code << ", expected " << code << "\nstdout: " << r.out
            << "stderr: " << r.err << "\n";
  return false;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("gitstamp_cli_" + std::to_string(std::random_device{}()));
  const fs::path root = base / "work";
  const fs::path empty = base / "empty";
  fs::create_directories(root);
  fs::create_directories(empty);
  for (const char *var : {"GIT_DIR", "GIT_INDEX_FILE", "GIT_OBJECT_DIRECTORY",
                          "GIT_ALTERNATE_OBJECT_DIRECTORIES"})
    ::unsetenv(var);
  ::setenv("XDG_CONFIG_HOME", (base / "xdg").c_str(), 1);

  const gitstamp::cli::StampFlags version_flags{.version = true, .untracked = true};
  const gitstamp::cli::StampFlags emit_flags{.version = true, .untracked = true, .emit = true};

  try {
    // Argument parsing
    {
      const auto a = parse({"version", "--abbrev", "12", "--suffix", "-dirty", "--no-untracked",
                            root.string()},
                           version_flags);
      if (!a || a->version.abbrev != 12 || a->version.suffix != "-dirty" ||
          a->version.include_untracked || a->path != root) {
        std::cerr << "version flags misparsed\n";
        return 1;
      }
      const auto dflt = parse({"version"}, version_flags);
      if (!dflt || dflt->path != fs::current_path() || dflt->version.abbrev != 40 ||
          dflt->version.suffix != ".modified") {
        std::cerr << "defaults not applied\n";
        return 1;
      }
      const auto e = parse({"emit", "--format", "header", "--prefix", "APP", "-o", "gen/stamp.h"},
                           emit_flags);
      if (!e || e->format != gitstamp::StampFormat::Header || e->prefix != "APP" ||
          e->output != fs::path("gen/stamp.h")) {
        std::cerr << "emit flags misparsed\n";
        return 1;
      }
    }
    for (const auto &[args, flags] :
         std::vector<std::pair<std::vector<std::string>, gitstamp::cli::StampFlags>>{
             {{"version", "--abbrev", "3"}, version_flags},
             {{"version", "--abbrev", "41"}, version_flags},
             {{"version", "--abbrev", "7x"}, version_flags},
             {{"version", "--abbrev"}, version_flags},
             {{"version", "a", "b"}, version_flags},
             {{"version", "--bogus"}, version_flags},
             {{"head", "--suffix", "x"}, {}},
             {{"status", "--format", "text"}, {.untracked = true}},
             {{"emit", "--format", "json"}, emit_flags},
         }) {
      if (parse(args, flags)) {
        std::cerr << "accepted bad arguments:";
        for (const auto &a : args)
          std::cerr << " " << a;
        std::cerr << "\n";
        return 1;
      }
    }

    // Outside any repository
    {
      const auto r = run(cmd_version, {"version", empty.string()});
      if (!check(r, 1, "version outside a repository") || !r.out.empty() ||
          !contains(r.err, "version: "))
        return 1;
      if (!check(run(cmd_emit, {"emit", "--format", "text", empty.string()}), 1,
                 "emit outside a repository"))
        return 1;
    }

    gitstamp::Repository repo{root};
    repo.init(gitstamp::Identity{.name = "User", .email = "u@example.com"});
    write_file(root / "a.txt", "alpha\n");
    {
      gitstamp::Index idx{repo.index_file()};
      idx.load();
      idx.add_path(root, "a.txt", repo);
      idx.save();
    }
    const std::string c1 = repo.commit_index("first\n");

    // version
    {
      const auto r = run(cmd_version, {"version", root.string()});
      if (!check(r, 0, "version on a clean tree") || r.out != c1 + "\n")
        return 1;
      const auto short_id = run(cmd_version, {"version", "--abbrev", "7", root.string()});
      if (!check(short_id, 0, "version --abbrev 7") || short_id.out != c1.substr(0, 7) + "\n")
        return 1;
      const auto bad = run(cmd_version, {"version", "--abbrev", "50", root.string()});
      if (!check(bad, 2, "version --abbrev 50") || !bad.out.empty() ||
          !contains(bad.err, "usage: gitstamp version"))
        return 1;
    }

    // head and status
    {
      const auto h = run(cmd_head, {"head", root.string()});
      if (!check(h, 0, "head") || h.out != c1 + " master\n")
        return 1;
      const auto s = run(cmd_status, {"status", root.string()});
      if (!check(s, 0, "status on a clean tree") || s.out != "On branch master\nclean\n")
        return 1;
    }

    // Untracked file marks the tree modified unless excluded
    write_file(root / "notes.txt", "todo\n");
    {
      const auto r = run(cmd_version, {"version", root.string()});
      if (!check(r, 0, "version with an untracked file") || r.out != c1 + ".modified\n")
        return 1;
      const auto quiet = run(cmd_version, {"version", "--no-untracked", root.string()});
      if (!check(quiet, 0, "version --no-untracked") || quiet.out != c1 + "\n")
        return 1;
      const auto s = run(cmd_status, {"status", root.string()});
      if (!check(s, 0, "status with an untracked file") ||
          !contains(s.out, "Untracked files:\n  notes.txt\n"))
        return 1;
    }
    fs::remove(root / "notes.txt");

    // emit usage errors
    {
      const auto no_format = run(cmd_emit, {"emit", root.string()});
      if (!check(no_format, 2, "emit without --format") ||
          !contains(no_format.err, "--format is required"))
        return 1;
      const auto bad_prefix =
          run(cmd_emit, {"emit", "--format", "header", "--prefix", "9X", root.string()});
      if (!check(bad_prefix, 2, "emit with a bad prefix") ||
          !contains(bad_prefix.err, "invalid macro prefix"))
        return 1;
      if (!check(run(cmd_emit, {"emit", "--format", "header", "--prefix", "A-B", root.string()}),
                 2, "emit with a dash in the prefix"))
        return 1;
    }

    // emit to stdout
    {
      const auto r = run(cmd_emit, {"emit", "--format", "properties", root.string()});
      if (!check(r, 0, "emit properties") || !contains(r.out, "build-commit.id=" + c1 + "\n") ||
          !contains(r.out, "build-commit.modified=false\n"))
        return 1;
    }

    // emit --output rewrites the file only when its content changes
    {
      const fs::path out = base / "gen" / "stamp.h";
      const std::vector<std::string> args{
          "emit", "--format", "header", "--prefix", "APP", "--output", out.string(),
          root.string()};
      const auto first = run(cmd_emit, args);
      if (!check(first, 0, "first emit --output") || !first.out.empty() ||
          !contains(first.err, "emit: wrote") ||
          !contains(slurp(out), "#define APP_COMMIT \"" + c1 + "\"\n")) {
        std::cerr << "first emit did not write the header\n";
        return 1;
      }
      const auto mtime = fs::last_write_time(out);
      const auto again = run(cmd_emit, args);
      if (!check(again, 0, "second emit --output") || !again.err.empty() ||
          fs::last_write_time(out) != mtime) {
        std::cerr << "unchanged stamp rewrote the file\n";
        return 1;
      }
      write_file(root / "a.txt", "alpha beta\n");
      const auto dirty = run(cmd_emit, args);
      if (!check(dirty, 0, "emit after an edit") || !contains(dirty.err, "emit: wrote") ||
          !contains(slurp(out), "#define APP_MODIFIED 1\n")) {
        std::cerr << "modified stamp not written\n";
        return 1;
      }
    }

    // A current directory that no longer exists is a usage error
    {
      const fs::path saved = fs::current_path();
      const fs::path gone = base / "gone";
      fs::create_directories(gone);
      fs::current_path(gone);
      fs::remove(gone);
      const auto r = run(cmd_version, {"version"});
      fs::current_path(saved);
      if (!check(r, 2, "version from a deleted directory") ||
          !contains(r.err, "current directory"))
        return 1;
    }

    std::cout << "cli OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec;
    fs::remove_all(base, ec);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
