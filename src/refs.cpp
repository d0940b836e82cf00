#include "gitstamp/refs.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/errors.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>

namespace gitstamp {

namespace {

// Names that could escape the git dir or that git itself refuses.
void check_refname(const std::string &refname) {
  const bool pseudo =
      !refname.empty() && std::ranges::all_of(refname, [](char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0 || c == '_';
      });
  const bool bad = refname.empty() || refname.front() == '/' || refname.back() == '/' ||
                   refname.find("..") != std::string::npos ||
                   refname.find("//") != std::string::npos ||
                   refname.find('\\') != std::string::npos || refname.ends_with(".lock");
  if (bad || (!pseudo && !refname.starts_with("refs/")))
    throw CorruptObjectError("invalid ref name: " + refname);
}

// HEAD, pseudo refs and per-worktree refs live in the worktree's git dir;
// everything else is shared through the common dir.
std::filesystem::path ref_path(const Repository &repo, const std::string &refname) {
  const bool per_worktree = !refname.starts_with("refs/") ||
                            refname.starts_with("refs/bisect/") ||
                            refname.starts_with("refs/worktree/") ||
                            refname.starts_with("refs/rewritten/");
  return (per_worktree ? repo.git_dir() : repo.common_dir()) / refname;
}

void write_text(const std::filesystem::path &p, const std::string &s) {
  fs::write_file_atomic(p, as_bytes(s));
}

} // namespace

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

std::map<std::string, std::string> read_packed_refs(const Repository &repo) {
  std::map<std::string, std::string> out;
  const auto text = fs::read_text(repo.packed_refs_file());
  if (!text)
    return out;

  std::istringstream iss(*text);
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line.front() == '#' || line.front() == '^')
      continue;
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos || !looks_hex40(std::string_view(line).substr(0, sp)))
      throw CorruptObjectError("packed-refs: malformed line: " + line);
    std::string hex = line.substr(0, sp);
    std::ranges::transform(hex, hex.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    out[line.substr(sp + 1)] = std::move(hex);
  }
  return out;
}

std::optional<std::string> read_ref(const Repository &repo, const std::string &refname) {
  check_refname(refname);
  const auto p = ref_path(repo, refname);
  if (fs::is_regular_file(p)) {
    auto s = *fs::read_text(p);
    // strip trailing whitespace/newlines
    strutil::rstrip_newlines(s);
    return s;
  }
  if (!refname.starts_with("refs/"))
    return std::nullopt;
  const auto packed = read_packed_refs(repo);
  if (const auto it = packed.find(refname); it != packed.end())
    return it->second;
  return std::nullopt;
}

RefResolution resolve_ref(const Repository &repo, const std::string &refname) {
  std::string name = refname;
  for (int depth = 0; depth <= consts::kMaxSymrefDepth; ++depth) {
    const auto value = read_ref(repo, name);
    if (!value)
      return RefResolution{.name = name, .target = std::nullopt};

    if (value->starts_with(consts::kRefPrefix)) {
      name = std::string(strutil::trim(std::string_view(*value).substr(consts::kRefPrefix.size())));
      continue;
    }
    const auto hex = strutil::trim(*value);
    if (!looks_hex40(hex))
      throw CorruptObjectError("ref " + name + ": malformed value");
    std::string lowered(hex);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return RefResolution{.name = name, .target = std::move(lowered)};
  }
  throw HeadUnresolvedError("symbolic ref chain too deep starting at " + refname);
}

HeadState resolve_head(const Repository &repo) {
  RefResolution res;
  try {
    res = resolve_ref(repo, std::string(consts::kHeadFile));
  } catch (const CorruptObjectError &e) {
    throw HeadUnresolvedError(std::string("cannot resolve HEAD: ") + e.what());
  }

  HeadState st;
  if (res.name != consts::kHeadFile)
    st.branch = res.name;
  st.commit = std::move(res.target);
  return st;
}

void set_HEAD_symbolic(const Repository &repo, const std::string &refname) {
  check_refname(refname);
  write_text(repo.head_file(), std::string(consts::kRefPrefix) + refname + "\n");
}

void update_ref(const Repository &repo, const std::string &refname, const std::string &hex_oid) {
  check_refname(refname);
  if (!looks_hex40(hex_oid))
    throw CorruptObjectError("update_ref: not an object id: " + hex_oid);
  write_text(ref_path(repo, refname), hex_oid + "\n");
}

void set_HEAD_detached(const Repository &repo, std::string_view hex_oid) {
  if (!looks_hex40(hex_oid))
    throw CorruptObjectError("set_HEAD_detached: not an object id: " + std::string(hex_oid));
  write_text(repo.head_file(), std::string(hex_oid) + "\n");
}

} // namespace gitstamp
