#pragma once
#include "gitstamp/consts.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitstamp {

class Repository; // fwd decl to avoid header cycle

struct IndexEntry {
  fs::FileStat  stat;           // cached stat data; `mode` unused, size truncated to 32 bits
  std::uint32_t mode{};         // e.g., gitstamp::consts::kModeFile
  oid           id{};           // blob id (20 bytes)
  std::uint16_t flags{};        // assume-valid, extended, stage, name length
  std::uint16_t ext_flags{};    // skip-worktree, intent-to-add (version 3+)
  std::string   path;           // "dir/file", UTF-8, no leading '/'

  [[nodiscard]] int stage() const { return (flags >> 12) & 0x3; }
  [[nodiscard]] bool assume_valid() const { return (flags & 0x8000) != 0; }
  [[nodiscard]] bool skip_worktree() const { return (ext_flags & 0x4000) != 0; }
  [[nodiscard]] bool intent_to_add() const { return (ext_flags & 0x2000) != 0; }
};

// The binary staging area ("DIRC"), versions 2-4.
class Index {
public:
  explicit Index(std::filesystem::path index_file);

  // Parse the index if it exists (no throw if missing).
  // Throws CorruptObjectError on a bad checksum or truncated data,
  // UnsupportedFormatError on unknown versions or mandatory extensions.
  void load();

  // Overwrite the index with current entries (version 2, with checksum)
  void save() const;

  // Read file at working-dir `wd/relpath`, write blob via repo, add/replace a stage-0 entry.
  // The mode is taken from the file (regular, executable or symlink).
  void add_path(const std::filesystem::path &wd, std::string_view relpath,
                const Repository &repo);

  // Remove a path from index (all stages; no error if absent)
  void remove_path(std::string_view relpath);

  // Append an entry verbatim (conflict stages, gitlinks); keeps path/stage order
  void add_entry(IndexEntry entry);

  const std::vector<IndexEntry> &entries() const { return entries_; }
  [[nodiscard]] std::uint32_t version() const { return version_; }

  // Modification time of the index file when it was loaded, for racy-clean checks
  [[nodiscard]] const std::optional<fs::FileStat> &file_stat() const { return file_stat_; }

private:
  void parse(std::span<const std::uint8_t> data);
  void sort_entries();

  std::filesystem::path index_file_;
  std::vector<IndexEntry> entries_;
  std::uint32_t version_ = 2;
  std::optional<fs::FileStat> file_stat_;
};

} // namespace gitstamp
