#include "gitstamp/config.hpp"
#include "gitstamp/errors.hpp"
#include "gitstamp/refs.hpp"
#include "gitstamp/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  // Make a unique temp repo root
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path repo_root = base / ("gitstamp_init_test_" + suffix);

  try {
    fs::create_directories(repo_root);

    gitstamp::Repository repo{repo_root};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }

    // Opening a plain directory is not a repository
    bool not_found = false;
    try {
      (void)gitstamp::Repository::open(repo_root);
    } catch (const gitstamp::RepositoryNotFoundError &) {
      not_found = true;
    }
    if (!not_found) {
      std::cerr << "open() on an empty directory did not throw RepositoryNotFoundError\n";
      return 1;
    }

    const gitstamp::Identity id{.name = "Test User", .email = "test@example.com"};
    repo.init(id);

    // Check directory layout
    const fs::path gitdir = repo_root / ".git";
    for (const fs::path &dir : {gitdir, gitdir / "objects", gitdir / "refs",
                                gitdir / "refs" / "heads", gitdir / "refs" / "tags"}) {
      if (!fs::is_directory(dir)) {
        std::cerr << dir << " missing\n";
        return 1;
      }
    }

    // Check HEAD contents
    const std::string head_txt = slurp(gitdir / "HEAD");
    if (head_txt != "ref: refs/heads/master\n") {
      std::cerr << "HEAD content mismatch: [" << head_txt << "]\n";
      return 1;
    }
    const auto head = gitstamp::resolve_head(repo);
    if (head.branch != "refs/heads/master" || head.commit) {
      std::cerr << "fresh HEAD should name an unborn master branch\n";
      return 1;
    }

    // Check config contents + loader
    const auto reopened = gitstamp::Repository::open(repo_root);
    const auto loaded = gitstamp::load_identity(reopened.config());
    if (loaded.name != id.name || loaded.email != id.email) {
      std::cerr << "config load mismatch: got {" << loaded.name << "," << loaded.email << "}\n";
      return 1;
    }
    if (reopened.is_bare()) {
      std::cerr << "fresh repository reported bare\n";
      return 1;
    }
    if (reopened.git_dir() != gitdir || reopened.common_dir() != gitdir) {
      std::cerr << "unexpected git dir " << reopened.git_dir() << "\n";
      return 1;
    }

    // Calling init again should throw
    bool threw = false;
    try {
      repo.init(id);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "init did not throw on already-initialized repo\n";
      return 1;
    }

    // Newer repository formats are refused
    {
      std::ofstream(gitdir / "config", std::ios::app)
          << "[extensions]\n\tobjectFormat = sha256\n";
      bool unsupported = false;
      try {
        (void)gitstamp::Repository::open(repo_root);
      } catch (const gitstamp::UnsupportedFormatError &) {
        unsupported = true;
      }
      if (!unsupported) {
        std::cerr << "sha256 repository was not rejected\n";
        return 1;
      }
    }

    // Success
    std::cout << "init test OK: " << repo_root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(repo_root);
    return 1;
  }

  // Clean up
  std::error_code ec;
  fs::remove_all(repo_root, ec);
  return 0;
}
