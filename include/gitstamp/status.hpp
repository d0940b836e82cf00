#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gitstamp {

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted };

struct Change {
  ChangeKind kind;
  std::string path; // repo-relative
};

struct Status {
  std::vector<Change> staged;          // HEAD vs index
  std::vector<Change> unstaged;        // index vs working tree
  std::vector<std::string> untracked;  // working tree - index - ignored
  std::vector<std::string> conflicted; // paths with entries at stages 1-3

  // Untracked files count only when they were collected (see StatusOptions)
  [[nodiscard]] bool is_clean() const {
    return staged.empty() && unstaged.empty() && untracked.empty() && conflicted.empty();
  }
};

struct StatusOptions {
  bool include_untracked = true; // walk the working tree for untracked files
};

class Repository; // fwd

// Compare HEAD, the index and the working tree. A bare repository is always clean.
auto compute_status(const Repository &repo, const StatusOptions &options = {}) -> Status;

} // namespace gitstamp
