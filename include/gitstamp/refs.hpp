#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gitstamp {

class Repository; // fwd decl to avoid header cycle

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Raw value of a single ref without following symbolic refs: a 40-hex id or
// "ref: <target>". Loose refs shadow packed-refs. nullopt if the ref does not exist.
std::optional<std::string> read_ref(const Repository &repo, const std::string &refname);

// All entries of packed-refs: refname -> 40-hex id (peeled "^" lines skipped).
std::map<std::string, std::string> read_packed_refs(const Repository &repo);

struct RefResolution {
  std::string name;                  // last ref in the symbolic chain
  std::optional<std::string> target; // 40-hex id; nullopt for an unborn ref
};

// Follow symbolic refs up to consts::kMaxSymrefDepth levels.
// Throws HeadUnresolvedError when the chain is too deep, CorruptObjectError on malformed refs.
RefResolution resolve_ref(const Repository &repo, const std::string &refname);

struct HeadState {
  std::optional<std::string> branch; // "refs/heads/<name>" when HEAD is symbolic
  std::optional<std::string> commit; // 40-hex id; nullopt on an unborn branch
};

// Resolve HEAD. A malformed HEAD throws HeadUnresolvedError.
HeadState resolve_head(const Repository &repo);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const Repository &repo, const std::string &refname);

void set_HEAD_detached(const Repository &repo, std::string_view hex_oid);

// Overwrite/create a loose ref with the given 40-hex OID (adds trailing newline on disk).
void update_ref(const Repository &repo, const std::string &refname, const std::string &hex_oid);

} // namespace gitstamp
