#pragma once
#include "gitstamp/consts.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gitstamp {

class Repository; // fwd

struct VersionOptions {
  std::string suffix{consts::kModifiedSuffix}; // appended when the tree is modified
  std::size_t abbrev = consts::kOidHexLen;     // hex digits of the commit id to keep (4..40)
  bool include_untracked = true;               // untracked files make the tree modified
};

// Build identifier derived from HEAD and the working tree
struct BuildStamp {
  std::string commit;  // full 40-hex id HEAD resolves to
  std::string branch;  // short branch name, empty when HEAD is detached
  bool modified = false;
  std::string version; // abbreviated commit + suffix when modified
};

// Throws HeadUnresolvedError when HEAD has no commit, std::invalid_argument on a bad abbrev.
auto compute_stamp(const Repository &repo, const VersionOptions &options = {}) -> BuildStamp;

// Opens the repository at `root` (GIT_* environment overrides apply) and returns
// the version string. Throws RepositoryNotFoundError, HeadUnresolvedError.
auto compute_version(const std::filesystem::path &root, const VersionOptions &options = {})
    -> std::string;

enum class StampFormat : std::uint8_t { Text, Properties, Header };

auto parse_format(std::string_view name) -> std::optional<StampFormat>;

// `prefix` names the header macros (<prefix>_COMMIT, ...); other formats ignore it.
auto render_stamp(const BuildStamp &stamp, StampFormat format, std::string_view prefix = "BUILD")
    -> std::string;

// Replace `path` atomically unless it already holds `content`. Returns true if written.
bool write_stamp_file(const std::filesystem::path &path, std::string_view content);

} // namespace gitstamp
