#include "cli/stamp_args.hpp"

#include "gitstamp/refs.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/status.hpp"

#include <iostream>

using gitstamp::ChangeKind;

int cmd_status(int argc, char **argv) {
  const auto args = gitstamp::cli::parse_stamp_args(
      argc, argv, {.version = false, .untracked = true, .emit = false});
  if (!args) {
    std::cerr << "usage: gitstamp status [--no-untracked] [path]\n";
    return 2;
  }

  try {
    const auto repo =
        gitstamp::Repository::open(args->path, gitstamp::RepositoryOptions::from_environment());

    // Print current branch or detached state
    const auto head = gitstamp::resolve_head(repo);
    if (head.branch) {
      const std::string &rn = *head.branch;
      const auto prefix = gitstamp::consts::kHeadsPrefix;
      std::cout << "On branch " << (rn.starts_with(prefix) ? rn.substr(prefix.size()) : rn)
                << "\n";
    } else if (head.commit) {
      std::cout << "HEAD detached at " << head.commit->substr(0, 7) << "\n";
    }

    const auto st = gitstamp::compute_status(
        repo, gitstamp::StatusOptions{.include_untracked = args->version.include_untracked});
    if (st.is_clean()) {
      std::cout << "clean\n";
      return 0;
    }

    auto print_changes = [](const char *header, const std::vector<gitstamp::Change> &xs) {
      if (xs.empty())
        return;
      std::cout << header << "\n";
      for (const auto &[kind, path] : xs) {
        const char code = (kind == ChangeKind::Added      ? 'A'
                           : kind == ChangeKind::Modified ? 'M'
                                                          : 'D');
        std::cout << "  " << code << "  " << path << "\n";
      }
    };
    auto print_paths = [](const char *header, const std::vector<std::string> &xs) {
      if (xs.empty())
        return;
      std::cout << header << "\n";
      for (const auto &p : xs)
        std::cout << "  " << p << "\n";
    };

    print_paths("Unmerged paths:", st.conflicted);
    print_changes("Changes to be committed:", st.staged);
    print_changes("Changes not staged for commit:", st.unstaged);
    print_paths("Untracked files:", st.untracked);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
