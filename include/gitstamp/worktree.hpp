#pragma once
#include "gitstamp/fs.hpp"
#include "gitstamp/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gitstamp {

class Repository; // fwd
class Index;
class IgnoreRules;

namespace worktree {

struct FileRef {
  std::uint32_t mode;
  oid id;
};

using PathMap = std::map<std::string, FileRef>; // repo-relative path -> mode + blob id

// Flatten a tree object recursively into path -> (mode, id)
auto tree_to_map(const Repository &repo, const std::string &tree_hex) -> PathMap;

// Stage-0 entries of the index
auto index_to_map(const Index &index) -> PathMap;

// Blob id of the working-tree file at `path` as git would store it:
// file contents for regular files, the link target for symlinks.
auto hash_file(const std::filesystem::path &path, const fs::FileStat &st) -> oid;

// Git mode ("100644", "100755", "120000") for a working-tree file
auto mode_for(const fs::FileStat &st) -> std::uint32_t;

// Ignore sources that apply before any .gitignore: core.excludesFile, info/exclude
void load_global_ignores(const Repository &repo, IgnoreRules &rules);

// Walk the working tree and collect files that are neither tracked nor ignored.
// `tracked` holds every index path (all stages). Untracked directories holding a
// nested repository are reported once as "dir/". Sorted.
auto untracked_paths(const Repository &repo, const std::set<std::string> &tracked)
    -> std::vector<std::string>;

} // namespace worktree

} // namespace gitstamp
