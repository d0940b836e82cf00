#include "gitstamp/status.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/index.hpp"
#include "gitstamp/refs.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/worktree.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace gfs = gitstamp::fs;

namespace gitstamp {

namespace {

bool same_ref(const worktree::FileRef &a, const worktree::FileRef &b) {
  return a.mode == b.mode && a.id == b.id;
}

// Cached stat data still describes the file, so its contents need not be hashed.
// Entries written in the same second as the index are "racily clean" and re-hashed.
bool stat_matches(const IndexEntry &e, const gfs::FileStat &st,
                  const std::optional<gfs::FileStat> &index_stat, bool trust_ctime) {
  if (e.stat.mtime_s != st.mtime_s || e.stat.mtime_ns != st.mtime_ns)
    return false;
  // A rewrite that restores the old mtime still moves ctime
  if (trust_ctime && (e.stat.ctime_s != st.ctime_s || e.stat.ctime_ns != st.ctime_ns))
    return false;
  if (e.stat.size != static_cast<std::uint32_t>(st.size))
    return false;
  if (e.stat.ino != 0 && e.stat.ino != st.ino)
    return false;
  if (!index_stat)
    return false;
  if (index_stat->mtime_s < e.stat.mtime_s)
    return false;
  return !(index_stat->mtime_s == e.stat.mtime_s && index_stat->mtime_ns <= e.stat.mtime_ns);
}

void diff_head_index(const worktree::PathMap &head, const Index &index, Status &st) {
  const worktree::PathMap staged = worktree::index_to_map(index);
  std::set<std::string> intent;
  for (const auto &e : index.entries()) {
    if (e.stage() == 0 && e.intent_to_add())
      intent.insert(e.path);
  }

  std::set<std::string> all;
  for (const auto &[p, _] : head)
    all.insert(p);
  for (const auto &[p, _] : staged)
    all.insert(p);

  for (const auto &path : all) {
    const auto it_h = head.find(path);
    const auto it_i = staged.find(path);
    const bool in_h = it_h != head.end();
    const bool in_i = it_i != staged.end();
    if (in_i && intent.contains(path)) {
      st.staged.push_back({in_h ? ChangeKind::Modified : ChangeKind::Added, path});
    } else if (in_h && in_i) {
      if (!same_ref(it_h->second, it_i->second))
        st.staged.push_back({ChangeKind::Modified, path});
    } else if (in_i) {
      st.staged.push_back({ChangeKind::Added, path});
    } else if (in_h) {
      // Conflicted paths have no stage-0 entry; they are reported separately
      const bool conflicted = std::ranges::binary_search(st.conflicted, path);
      if (!conflicted)
        st.staged.push_back({ChangeKind::Deleted, path});
    }
  }
}

void diff_index_worktree(const Repository &repo, const Index &index, Status &st) {
  const bool trust_filemode = repo.config().get_bool("core.fileMode", true);
  const bool trust_ctime = repo.config().get_bool("core.trustCtime", true);

  for (const auto &e : index.entries()) {
    if (e.stage() != 0 || e.skip_worktree() || e.assume_valid())
      continue;
    if ((e.mode & consts::kModeTypeMask) == consts::kModeGitlink)
      continue;

    const auto abs = repo.root() / e.path;
    const auto st_now = gfs::lstat_path(abs);
    if (!st_now || st_now->is_directory()) {
      st.unstaged.push_back({ChangeKind::Deleted, e.path});
      continue;
    }

    // Type changes always count; the executable bit only when core.fileMode is set
    const std::uint32_t disk_mode = worktree::mode_for(*st_now);
    const bool was_link = e.mode == consts::kModeSymlink;
    if (was_link != st_now->is_symlink() ||
        (trust_filemode && !was_link && disk_mode != e.mode)) {
      st.unstaged.push_back({ChangeKind::Modified, e.path});
      continue;
    }

    if (e.intent_to_add() || !stat_matches(e, *st_now, index.file_stat(), trust_ctime)) {
      if (e.intent_to_add() || worktree::hash_file(abs, *st_now) != e.id)
        st.unstaged.push_back({ChangeKind::Modified, e.path});
    }
  }
}

} // namespace

Status compute_status(const Repository &repo, const StatusOptions &options) {
  Status st;
  if (repo.is_bare())
    return st;

  Index index{repo.index_file()};
  index.load();

  std::set<std::string> tracked;
  std::set<std::string> conflicted;
  for (const auto &e : index.entries()) {
    tracked.insert(e.path);
    if (e.stage() != 0)
      conflicted.insert(e.path);
  }
  st.conflicted.assign(conflicted.begin(), conflicted.end());

  // Unborn branch: everything in the index is staged as Added
  worktree::PathMap head_map;
  if (const HeadState head = resolve_head(repo); head.commit) {
    head_map = worktree::tree_to_map(repo, repo.read_commit(*head.commit).tree_hex);
  }

  diff_head_index(head_map, index, st);
  diff_index_worktree(repo, index, st);

  if (options.include_untracked)
    st.untracked = worktree::untracked_paths(repo, tracked);
  return st;
}

} // namespace gitstamp
