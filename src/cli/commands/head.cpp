#include "cli/stamp_args.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/refs.hpp"
#include "gitstamp/repo.hpp"

#include <iostream>

int cmd_head(int argc, char **argv) {
  const auto args = gitstamp::cli::parse_stamp_args(argc, argv, {});
  if (!args) {
    std::cerr << "usage: gitstamp head [path]\n";
    return 2;
  }

  try {
    const auto repo =
        gitstamp::Repository::open(args->path, gitstamp::RepositoryOptions::from_environment());
    const std::string commit = repo.head_commit();
    const gitstamp::HeadState head = gitstamp::resolve_head(repo);

    std::cout << commit << " ";
    if (!head.branch)
      std::cout << "detached\n";
    else if (head.branch->starts_with(gitstamp::consts::kHeadsPrefix))
      std::cout << head.branch->substr(gitstamp::consts::kHeadsPrefix.size()) << "\n";
    else
      std::cout << *head.branch << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "head: " << e.what() << "\n";
    return 1;
  }
}
