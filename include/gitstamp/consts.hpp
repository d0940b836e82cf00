#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitstamp::consts {

// Directory and file names
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kPackDir       = "pack";
inline constexpr std::string_view kInfoDir       = "info";
inline constexpr std::string_view kAlternates    = "alternates";
inline constexpr std::string_view kExcludeFile   = "exclude";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kPackedRefs    = "packed-refs";
inline constexpr std::string_view kCommonDir     = "commondir";
inline constexpr std::string_view kGitIgnore     = ".gitignore";
inline constexpr std::string_view kDefaultBranch = "master";

// Appended to the commit id when the working tree differs from HEAD
inline constexpr std::string_view kModifiedSuffix = ".modified";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644; // regular file
inline constexpr std::uint32_t kModeExec    = 0100755; // executable file
inline constexpr std::uint32_t kModeSymlink = 0120000;
inline constexpr std::uint32_t kModeGitlink = 0160000; // submodule commit
inline constexpr std::uint32_t kModeTree    = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeTypeMask = 0170000;

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20; // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40; // 40 hex chars (SHA-1)
inline constexpr std::size_t kMinAbbrev = 4;

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Refs ———
inline constexpr std::string_view kRefPrefix    = "ref: ";
inline constexpr std::string_view kGitdirPrefix = "gitdir: ";
inline constexpr std::string_view kHeadsPrefix  = "refs/heads/";
inline constexpr int kMaxSymrefDepth = 5;

// ——— Commit header prefixes (used in parsing/formatting) ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Index file ———
inline constexpr std::string_view kIndexSignature = "DIRC";
inline constexpr std::size_t kIndexHeaderLen = 12;
inline constexpr std::size_t kIndexEntryFixedLen = 62; // stat data + oid + flags

// ——— Pack files ———
inline constexpr std::string_view kPackSignature = "PACK";
inline constexpr std::uint32_t kPackIdxMagic = 0xff744f63; // "\377tOc"
inline constexpr std::size_t kPackHeaderLen = 12;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitstamp::consts
