#pragma once
#include "gitstamp/config.hpp"
#include "gitstamp/consts.hpp"
#include "gitstamp/hash.hpp"
#include "gitstamp/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstamp {

struct TreeEntry {
  std::uint32_t mode; // e.g., gitstamp::consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

// Overrides for where repository metadata lives. Unset fields use the
// layout found on disk.
struct RepositoryOptions {
  std::optional<std::filesystem::path> git_dir;
  std::optional<std::filesystem::path> index_file;
  std::optional<std::filesystem::path> object_directory;
  std::vector<std::filesystem::path> alternate_object_directories;

  // GIT_DIR, GIT_INDEX_FILE, GIT_OBJECT_DIRECTORY, GIT_ALTERNATE_OBJECT_DIRECTORIES
  static RepositoryOptions from_environment();
};

class Repository {
public:
  // Locates metadata for `root` without validating it; see open().
  explicit Repository(std::filesystem::path root, RepositoryOptions options = {});

  // Open an existing repository. Throws RepositoryNotFoundError if `root` has no
  // repository metadata, UnsupportedFormatError for formats this library cannot read.
  static Repository open(const std::filesystem::path &root, RepositoryOptions options = {});

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return git_dir_; }
  // Shared metadata (refs, objects, config); differs from git_dir() in linked worktrees
  [[nodiscard]] const std::filesystem::path &common_dir() const { return common_dir_; }
  [[nodiscard]] const std::filesystem::path &index_file() const { return index_file_; }
  [[nodiscard]] auto objects_dir() const -> const std::filesystem::path & {
    return objects_->objects_dir();
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir_ / consts::kHeadFile;
  }
  [[nodiscard]] auto packed_refs_file() const -> std::filesystem::path {
    return common_dir_ / consts::kPackedRefs;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return common_dir_ / consts::kConfigFile;
  }
  [[nodiscard]] auto info_exclude_file() const -> std::filesystem::path {
    return common_dir_ / consts::kInfoDir / consts::kExcludeFile;
  }

  // Initialize a new non-bare repository under root()/.git.
  // Fails if metadata already exists (to avoid clobber).
  void init(const Identity &identity = Identity{.name = "Your Name",
                                                .email = "you@example.com"}) const;

  // HEAD, objects/ and refs/ present
  [[nodiscard]] auto is_initialized() const -> bool;
  // No working tree: root() is the git dir itself, or core.bare is set
  [[nodiscard]] auto is_bare() const -> bool;

  // Re-read on every call; the config is small and read a handful of times per run.
  [[nodiscard]] auto config() const -> GitConfig;

  [[nodiscard]] auto objects() const -> const ObjectStore & { return *objects_; }

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;

  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::string message;              // raw message (may contain newlines)
  };

  // Read and parse a commit object into headers + message.
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // 40-hex id HEAD resolves to. Throws HeadUnresolvedError on an unborn branch
  // or when HEAD names an object that is not in the store.
  [[nodiscard]] auto head_commit() const -> std::string;

  // Build nested tree objects from index stage 0; returns the root tree id
  [[nodiscard]] auto write_tree_from_index() const -> std::string;
  // Commit the index on top of HEAD and advance the current branch (or detached HEAD).
  // Signature lines use user.name/user.email and the current time.
  [[nodiscard]] auto commit_index(std::string_view message) const -> std::string;

private:
  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
  std::filesystem::path index_file_;
  bool root_is_git_dir_ = false;
  std::unique_ptr<ObjectStore> objects_;
};

} // namespace gitstamp
