#include "gitstamp/worktree.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/ignore.hpp"
#include "gitstamp/index.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/util.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace gfs = gitstamp::fs;
namespace stdfs = std::filesystem;

namespace gitstamp::worktree {

static void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                             const std::string &prefix, PathMap &out) {
  for (auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree)
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    else
      out[prefix + e.name] = FileRef{.mode = e.mode, .id = e.id};
  }
}

PathMap tree_to_map(const Repository &repo, const std::string &tree_hex) {
  PathMap m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

PathMap index_to_map(const Index &index) {
  PathMap m;
  for (const auto &e : index.entries()) {
    if (e.stage() == 0)
      m[e.path] = FileRef{.mode = e.mode, .id = e.id};
  }
  return m;
}

oid hash_file(const stdfs::path &path, const fs::FileStat &st) {
  if (st.is_symlink())
    return compute_blob_oid(as_bytes(gfs::read_link(path)));
  return compute_blob_oid(gfs::read_file(path));
}

std::uint32_t mode_for(const fs::FileStat &st) {
  if (st.is_symlink())
    return consts::kModeSymlink;
  return st.is_executable() ? consts::kModeExec : consts::kModeFile;
}

void load_global_ignores(const Repository &repo, IgnoreRules &rules) {
  const char *home = std::getenv("HOME");
  std::optional<stdfs::path> excludes;
  if (auto configured = repo.config().get("core.excludesFile")) {
    if (configured->starts_with("~/") && home != nullptr)
      excludes = stdfs::path(home) / configured->substr(2);
    else
      excludes = stdfs::path(*configured);
  } else if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
    excludes = stdfs::path(xdg) / "git" / "ignore";
  } else if (home != nullptr) {
    excludes = stdfs::path(home) / ".config" / "git" / "ignore";
  }
  if (excludes)
    rules.add_global_file(*excludes);
  rules.add_global_file(repo.info_exclude_file());
}

namespace {

struct Walker {
  const Repository &repo;
  const std::set<std::string> &tracked;
  std::set<std::string> tracked_dirs; // every parent directory of a tracked path
  IgnoreRules rules;
  std::vector<std::string> out;

  void walk(const stdfs::path &abs, const std::string &rel) {
    rules.push_directory(abs, rel);

    std::vector<stdfs::directory_entry> children(stdfs::directory_iterator(abs),
                                                 stdfs::directory_iterator{});
    std::ranges::sort(children, [](const auto &a, const auto &b) {
      return a.path().filename().native() < b.path().filename().native();
    });

    for (const auto &entry : children) {
      const std::string name = entry.path().filename().string();
      if (name == consts::kGitDir || entry.path() == repo.git_dir())
        continue;
      const std::string child_rel = rel.empty() ? name : rel + "/" + name;

      // Symlinks are leaf entries, even when they point at directories
      if (entry.symlink_status().type() == stdfs::file_type::directory) {
        if (tracked.contains(child_rel) || rules.is_ignored(child_rel, true))
          continue; // submodule checkout, or ignored as a whole
        if (!tracked_dirs.contains(child_rel) && gfs::exists(entry.path() / consts::kGitDir)) {
          out.push_back(child_rel + "/"); // nested repository
          continue;
        }
        walk(entry.path(), child_rel);
        continue;
      }
      if (tracked.contains(child_rel) || rules.is_ignored(child_rel, false))
        continue;
      out.push_back(child_rel);
    }

    rules.pop_directory();
  }
};

} // namespace

std::vector<std::string> untracked_paths(const Repository &repo,
                                         const std::set<std::string> &tracked) {
  Walker w{.repo = repo, .tracked = tracked, .tracked_dirs = {}, .rules = {}, .out = {}};
  for (const auto &path : tracked) {
    for (auto slash = path.find('/'); slash != std::string::npos;
         slash = path.find('/', slash + 1))
      w.tracked_dirs.insert(path.substr(0, slash));
  }
  load_global_ignores(repo, w.rules);
  w.walk(repo.root(), "");
  std::ranges::sort(w.out);
  return std::move(w.out);
}

} // namespace gitstamp::worktree
