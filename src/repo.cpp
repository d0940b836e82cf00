#include "gitstamp/repo.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/errors.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/index.hpp"
#include "gitstamp/refs.hpp"
#include "gitstamp/time.hpp"
#include "gitstamp/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace gfs   = gitstamp::fs;

namespace {
[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

[[nodiscard]] bool looks_like_git_dir(const stdfs::path& dir) {
  return gfs::is_regular_file(dir / gitstamp::consts::kHeadFile) &&
         gfs::is_directory(dir / gitstamp::consts::kObjectsDir) &&
         gfs::is_directory(dir / gitstamp::consts::kRefsDir);
}

// "<root>/.git" as a file: "gitdir: <path>", relative to the file's directory
[[nodiscard]] stdfs::path read_gitfile(const stdfs::path& file) {
  const auto text = gfs::read_text(file).value_or("");
  const auto line = gitstamp::strutil::trim(text);
  if (!line.starts_with(gitstamp::consts::kGitdirPrefix)) {
    throw gitstamp::RepositoryNotFoundError("invalid gitfile format: " + file.string());
  }
  stdfs::path target{std::string(
      gitstamp::strutil::trim(line.substr(gitstamp::consts::kGitdirPrefix.size())))};
  if (target.is_relative()) {
    target = file.parent_path() / target;
  }
  return target.lexically_normal();
}

[[nodiscard]] std::string lower(std::string s) {
  std::ranges::transform(s, s.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
} // namespace

namespace gitstamp {

RepositoryOptions RepositoryOptions::from_environment() {
  RepositoryOptions opts;
  auto env = [](const char* name) -> std::optional<stdfs::path> {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
      return std::nullopt;
    }
    return stdfs::path{v};
  };
  opts.git_dir = env("GIT_DIR");
  opts.index_file = env("GIT_INDEX_FILE");
  opts.object_directory = env("GIT_OBJECT_DIRECTORY");
  if (const char* alts = std::getenv("GIT_ALTERNATE_OBJECT_DIRECTORIES")) {
    std::istringstream iss{std::string(alts)};
    std::string dir;
    while (std::getline(iss, dir, ':')) {
      if (!dir.empty()) {
        opts.alternate_object_directories.emplace_back(dir);
      }
    }
  }
  return opts;
}

Repository::Repository(stdfs::path root, RepositoryOptions options) : root_(std::move(root)) {
  if (options.git_dir) {
    git_dir_ = options.git_dir->is_relative() ? root_ / *options.git_dir : *options.git_dir;
  } else {
    const auto dotgit = root_ / consts::kGitDir;
    if (gfs::is_regular_file(dotgit)) {
      git_dir_ = read_gitfile(dotgit);
    } else if (!gfs::exists(dotgit) && looks_like_git_dir(root_)) {
      git_dir_ = root_;
      root_is_git_dir_ = true;
    } else {
      git_dir_ = dotgit;
    }
  }

  common_dir_ = git_dir_;
  if (const auto text = gfs::read_text(git_dir_ / consts::kCommonDir)) {
    stdfs::path common{std::string(strutil::trim(*text))};
    common_dir_ = (common.is_relative() ? git_dir_ / common : common).lexically_normal();
    if (!common_dir_.has_filename() && common_dir_.has_parent_path()) {
      common_dir_ = common_dir_.parent_path(); // "a/b/.." normalizes to "a/"
    }
  }

  index_file_ = options.index_file.value_or(git_dir_ / consts::kIndexFile);
  auto objects_dir = options.object_directory.value_or(common_dir_ / consts::kObjectsDir);
  objects_ = std::make_unique<ObjectStore>(std::move(objects_dir),
                                           std::move(options.alternate_object_directories));
}

Repository Repository::open(const stdfs::path& root, RepositoryOptions options) {
  if (!gfs::is_directory(root)) {
    throw RepositoryNotFoundError("not a directory: " + root.string());
  }
  Repository repo{root, std::move(options)};
  if (!repo.is_initialized()) {
    throw RepositoryNotFoundError("not a git repository (no metadata under " +
                                  repo.git_dir().string() + ")");
  }

  const GitConfig cfg = repo.config();
  if (const long version = cfg.get_int("core.repositoryformatversion", 0); version > 1) {
    throw UnsupportedFormatError("unsupported repository format version " +
                                 std::to_string(version));
  }
  if (const auto fmt = cfg.get("extensions.objectformat"); fmt && lower(*fmt) != "sha1") {
    throw UnsupportedFormatError("unsupported object format: " + *fmt);
  }
  if (const auto refs = cfg.get("extensions.refstorage"); refs && lower(*refs) != "files") {
    throw UnsupportedFormatError("unsupported ref storage: " + *refs);
  }
  return repo;
}

auto Repository::is_initialized() const -> bool {
  return gfs::is_regular_file(head_file()) && gfs::is_directory(objects_dir()) &&
         gfs::is_directory(refs_dir());
}

auto Repository::is_bare() const -> bool {
  if (root_is_git_dir_) {
    return true;
  }
  // A linked worktree always has a working tree, even off a bare main repository
  if (git_dir_ != common_dir_) {
    return false;
  }
  return config().get_bool("core.bare", false);
}

auto Repository::config() const -> GitConfig { return GitConfig::load(config_file()); }

void Repository::init(const Identity& identity) const {
  if (is_initialized()) {
    throw std::runtime_error("A git repository already exists at: " + git_dir_.string());
  }

  for (const auto& dir : {objects_dir(), heads_dir(), tags_dir(),
                          common_dir_ / consts::kInfoDir}) {
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("create " + dir.string() + " failed: " + ec.message());
    }
  }

  set_HEAD_symbolic(*this, heads_ref(consts::kDefaultBranch));

  std::ostringstream os;
  os << "[core]\n"
     << "\trepositoryformatversion = 0\n"
     << "\tfilemode = true\n"
     << "\tbare = false\n"
     << "[user]\n"
     << "\tname = " << identity.name << "\n"
     << "\temail = " << identity.email << "\n";
  const std::string text = os.str();
  gfs::write_file_atomic(config_file(), as_bytes(text));
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw CorruptObjectError("tree parse: bad mode '" + std::string(s) + "'");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  return objects_->write(consts::kTypeBlob, bytes);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  // Git orders trees as if directory names carried a trailing '/'
  auto sort_key = [](const TreeEntry& e) {
    return e.mode == consts::kModeTree ? e.name + "/" : e.name;
  };
  auto entries = entries_in;
  std::ranges::sort(entries, [&](const TreeEntry& a, const TreeEntry& b) {
    return sort_key(a) < sort_key(b);
  });

  std::string data;
  for (const auto& e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }
  return objects_->write(consts::kTypeTree, as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = objects_->read(hex_oid);
  if (type != consts::kTypeTree) {
    throw CorruptObjectError("object " + std::string(hex_oid) + " is not a tree");
  }

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw CorruptObjectError("tree parse: expected space");
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw CorruptObjectError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw CorruptObjectError("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += consts::kLF;

  for (const auto& p : parent_hexes) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += consts::kLF;
  }

  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += consts::kLF;

  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";

  txt += message;
  return objects_->write(consts::kTypeCommit, as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = objects_->read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw CorruptObjectError("object " + std::string(commit_hex) + " is not a commit");
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size());
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size()));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) {
      break;
    }
    pos = nl + 1;
  }

  if (!looks_hex40(info.tree_hex)) {
    throw CorruptObjectError("commit " + std::string(commit_hex) + " has no valid tree");
  }
  return info;
}

auto Repository::head_commit() const -> std::string {
  const HeadState head = resolve_head(*this);
  if (!head.commit) {
    if (head.branch) {
      throw HeadUnresolvedError("HEAD points to branch '" + *head.branch +
                                "' which has no commits yet");
    }
    throw HeadUnresolvedError("HEAD cannot be resolved");
  }

  oid id{};
  if (!from_hex(*head.commit, id) || !objects_->contains(id)) {
    throw HeadUnresolvedError("HEAD points to missing object " + *head.commit);
  }
  return *head.commit;
}

auto Repository::write_tree_from_index() const -> std::string {
  Index idx{index_file_};
  idx.load();
  std::vector<IndexEntry> ents;
  std::ranges::copy_if(idx.entries(), std::back_inserter(ents),
                       [](const IndexEntry& e) { return e.stage() == 0; });

  const auto build = [&](const auto& self, const std::vector<IndexEntry>& group) -> std::string {
    std::map<std::string, std::vector<IndexEntry>> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto& e : group) {
      const auto [first, rest] = split_first(e.path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.mode = e.mode, .name = first, .id = e.id});
      } else {
        IndexEntry child = e;
        child.path = rest;
        subdirs[first].push_back(std::move(child));
      }
    }

    for (auto& [dirname, child_entries] : subdirs) {
      const std::string subtree_hex = self(self, child_entries);

      oid subtree_oid{};
      if (!from_hex(subtree_hex, subtree_oid)) {
        throw std::runtime_error("bad subtree hex oid");
      }
      tree_entries.push_back(
          TreeEntry{.mode = consts::kModeTree, .name = dirname, .id = subtree_oid});
    }

    return write_tree(tree_entries);
  };

  return build(build, ents);
}

auto Repository::commit_index(std::string_view message) const -> std::string {
  if (!is_initialized()) {
    throw RepositoryNotFoundError("not a git repository: " + root_.string());
  }

  const std::string tree_hex = write_tree_from_index();
  const HeadState head = resolve_head(*this);

  std::vector<std::string> parents;
  if (head.commit) {
    parents.push_back(*head.commit);
  }

  const Identity id = load_identity(config());
  const std::time_t now = std::time(nullptr);
  const int tz_min = timeutil::local_utc_offset_minutes(now);
  const std::string sig = timeutil::make_signature(id, now, tz_min);

  const std::string commit_hex = write_commit(tree_hex, parents, sig, sig, message);

  if (head.branch) {
    update_ref(*this, *head.branch, commit_hex);
  } else {
    set_HEAD_detached(*this, commit_hex);
  }
  return commit_hex;
}

} // namespace gitstamp
