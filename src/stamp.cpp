#include "gitstamp/stamp.hpp"

#include "gitstamp/fs.hpp"
#include "gitstamp/refs.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/status.hpp"
#include "gitstamp/util.hpp"

#include <stdexcept>

namespace gfs = gitstamp::fs;

namespace gitstamp {

namespace {

// C string literal body: quotes, backslashes and control bytes escaped
std::string c_escape(std::string_view s) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(s.size());
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
      out.push_back(ch);
    } else if (c < 0x20 || c == 0x7f) {
      out += "\\x";
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0xf]);
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace

BuildStamp compute_stamp(const Repository &repo, const VersionOptions &options) {
  if (options.abbrev < consts::kMinAbbrev || options.abbrev > consts::kOidHexLen) {
    throw std::invalid_argument("abbrev must be between " + std::to_string(consts::kMinAbbrev) +
                                " and " + std::to_string(consts::kOidHexLen));
  }

  BuildStamp stamp;
  stamp.commit = repo.head_commit();
  if (const HeadState head = resolve_head(repo);
      head.branch && head.branch->starts_with(consts::kHeadsPrefix)) {
    stamp.branch = head.branch->substr(consts::kHeadsPrefix.size());
  }

  const Status st =
      compute_status(repo, StatusOptions{.include_untracked = options.include_untracked});
  stamp.modified = !st.is_clean();

  stamp.version = stamp.commit.substr(0, options.abbrev);
  if (stamp.modified)
    stamp.version += options.suffix;
  return stamp;
}

std::string compute_version(const std::filesystem::path &root, const VersionOptions &options) {
  const Repository repo = Repository::open(root, RepositoryOptions::from_environment());
  return compute_stamp(repo, options).version;
}

std::optional<StampFormat> parse_format(std::string_view name) {
  if (name == "text")
    return StampFormat::Text;
  if (name == "properties")
    return StampFormat::Properties;
  if (name == "header")
    return StampFormat::Header;
  return std::nullopt;
}

std::string render_stamp(const BuildStamp &stamp, StampFormat format, std::string_view prefix) {
  const std::string modified = stamp.modified ? "true" : "false";
  std::string out;
  switch (format) {
  case StampFormat::Text:
    out = stamp.version + "\n";
    break;
  case StampFormat::Properties:
    out += "build-commit=" + stamp.version + "\n";
    out += "build-commit.id=" + stamp.commit + "\n";
    out += "build-commit.modified=" + modified + "\n";
    out += "build-commit.branch=" + stamp.branch + "\n";
    break;
  case StampFormat::Header: {
    const std::string p{prefix};
    out += "// Generated by gitstamp. Do not edit.\n";
    out += "#pragma once\n\n";
    out += "#define " + p + "_COMMIT \"" + c_escape(stamp.version) + "\"\n";
    out += "#define " + p + "_COMMIT_ID \"" + stamp.commit + "\"\n";
    out += "#define " + p + "_MODIFIED " + (stamp.modified ? "1" : "0") + "\n";
    out += "#define " + p + "_BRANCH \"" + c_escape(stamp.branch) + "\"\n";
    break;
  }
  }
  return out;
}

bool write_stamp_file(const std::filesystem::path &path, std::string_view content) {
  if (const auto current = gfs::read_text(path); current && *current == content)
    return false;
  gfs::ensure_parent_dir(path);
  gfs::write_file_atomic(path, as_bytes(content));
  return true;
}

} // namespace gitstamp
