#include "gitstamp/index.hpp"

#include "gitstamp/errors.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/hash.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/util.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace gitstamp {

namespace {

constexpr std::uint16_t kFlagExtended = 0x4000;
constexpr std::uint16_t kNameMask = 0x0fff;

std::uint32_t get32(std::span<const std::uint8_t> b, std::size_t off) {
  return (static_cast<std::uint32_t>(b[off]) << 24) |
         (static_cast<std::uint32_t>(b[off + 1]) << 16) |
         (static_cast<std::uint32_t>(b[off + 2]) << 8) | static_cast<std::uint32_t>(b[off + 3]);
}

std::uint16_t get16(std::span<const std::uint8_t> b, std::size_t off) {
  return static_cast<std::uint16_t>((b[off] << 8) | b[off + 1]);
}

void put32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

void put16(std::vector<std::uint8_t> &out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

[[noreturn]] void corrupt(const std::string &what) {
  throw CorruptObjectError("index: " + what);
}

bool entry_less(const IndexEntry &a, const IndexEntry &b) {
  if (a.path != b.path)
    return a.path < b.path;
  return a.stage() < b.stage();
}

} // namespace

Index::Index(std::filesystem::path index_file) : index_file_(std::move(index_file)) {}

void Index::load() {
  entries_.clear();
  version_ = 2;
  file_stat_ = fs::lstat_path(index_file_);
  if (!file_stat_)
    return;
  const auto bytes = fs::read_file(index_file_);
  parse(bytes);
}

void Index::parse(std::span<const std::uint8_t> data) {
  if (data.size() < consts::kIndexHeaderLen + consts::kOidRawLen)
    corrupt("file too short");
  if (std::memcmp(data.data(), consts::kIndexSignature.data(), 4) != 0)
    corrupt("bad signature");

  version_ = get32(data, 4);
  if (version_ < 2 || version_ > 4)
    throw UnsupportedFormatError("index: unsupported version " + std::to_string(version_));

  // Trailer is SHA-1 of everything before it; all zeros when index.skipHash is set
  const std::size_t body_len = data.size() - consts::kOidRawLen;
  oid trailer{};
  std::memcpy(trailer.data(), data.data() + body_len, consts::kOidRawLen);
  if (!is_null(trailer) && sha1(data.first(body_len)) != trailer)
    corrupt("checksum mismatch");

  const std::uint32_t count = get32(data, 8);
  std::size_t pos = consts::kIndexHeaderLen;
  std::string prev_path;
  entries_.reserve(count);

  for (std::uint32_t i = 0; i < count; ++i) {
    const std::size_t start = pos;
    if (pos + consts::kIndexEntryFixedLen > body_len)
      corrupt("truncated entry");

    IndexEntry e{};
    e.stat.ctime_s = get32(data, pos);
    e.stat.ctime_ns = get32(data, pos + 4);
    e.stat.mtime_s = get32(data, pos + 8);
    e.stat.mtime_ns = get32(data, pos + 12);
    e.stat.dev = get32(data, pos + 16);
    e.stat.ino = get32(data, pos + 20);
    e.mode = get32(data, pos + 24);
    e.stat.uid = get32(data, pos + 28);
    e.stat.gid = get32(data, pos + 32);
    e.stat.size = get32(data, pos + 36);
    std::memcpy(e.id.data(), data.data() + pos + 40, consts::kOidRawLen);
    e.flags = get16(data, pos + 60);
    pos += consts::kIndexEntryFixedLen;

    if ((e.flags & kFlagExtended) != 0) {
      if (version_ < 3)
        corrupt("extended flags in a version 2 index");
      if (pos + 2 > body_len)
        corrupt("truncated entry");
      e.ext_flags = get16(data, pos);
      pos += 2;
    }

    if (version_ == 4) {
      // Path is stored as: strip N bytes from the previous path, append NUL-terminated suffix
      // (same offset varint as pack OFS_DELTA: +1 per continuation byte)
      if (pos >= body_len)
        corrupt("truncated path prefix");
      std::uint8_t c = data[pos++];
      std::size_t strip = c & 0x7f;
      while ((c & 0x80) != 0) {
        if (pos >= body_len || strip > (SIZE_MAX >> 8))
          corrupt("truncated path prefix");
        c = data[pos++];
        strip = ((strip + 1) << 7) | (c & 0x7f);
      }
      if (strip > prev_path.size())
        corrupt("path prefix longer than previous path");
      const auto nul = std::find(data.begin() + static_cast<std::ptrdiff_t>(pos),
                                 data.begin() + static_cast<std::ptrdiff_t>(body_len),
                                 static_cast<std::uint8_t>(0));
      if (nul == data.begin() + static_cast<std::ptrdiff_t>(body_len))
        corrupt("unterminated path");
      e.path = prev_path.substr(0, prev_path.size() - strip);
      e.path.append(data.begin() + static_cast<std::ptrdiff_t>(pos), nul);
      pos = static_cast<std::size_t>(nul - data.begin()) + 1;
    } else {
      const auto nul = std::find(data.begin() + static_cast<std::ptrdiff_t>(pos),
                                 data.begin() + static_cast<std::ptrdiff_t>(body_len),
                                 static_cast<std::uint8_t>(0));
      if (nul == data.begin() + static_cast<std::ptrdiff_t>(body_len))
        corrupt("unterminated path");
      e.path.assign(data.begin() + static_cast<std::ptrdiff_t>(pos), nul);
      // Entries are NUL-padded to a multiple of 8 bytes
      const std::size_t fixed = pos - start;
      pos = start + ((fixed + e.path.size() + 8) & ~static_cast<std::size_t>(7));
      if (pos > body_len)
        corrupt("truncated entry padding");
    }

    if ((e.flags & kNameMask) != kNameMask && (e.flags & kNameMask) != e.path.size())
      corrupt("name length mismatch for " + e.path);
    if ((e.mode & consts::kModeTypeMask) == consts::kModeTree)
      throw UnsupportedFormatError("index: sparse directory entries are not supported");
    if (e.path.empty())
      corrupt("empty path");

    prev_path = e.path;
    entries_.push_back(std::move(e));
  }

  // Extensions: 4-byte signature, 4-byte size, payload
  while (pos + 8 <= body_len) {
    const char first = static_cast<char>(data[pos]);
    const std::string sig(reinterpret_cast<const char *>(data.data() + pos), 4);
    const std::uint32_t size = get32(data, pos + 4);
    if (pos + 8 + size > body_len)
      corrupt("truncated extension " + sig);
    if (first < 'A' || first > 'Z')
      throw UnsupportedFormatError("index: mandatory extension '" + sig + "' not supported");
    pos += 8 + size;
  }
  if (pos != body_len)
    corrupt("trailing garbage");
}

void Index::save() const {
  const bool extended = std::ranges::any_of(entries_, [](const IndexEntry &e) {
    return e.ext_flags != 0;
  });
  const std::uint32_t version = extended ? 3 : 2;

  std::vector<std::uint8_t> out;
  out.insert(out.end(), consts::kIndexSignature.begin(), consts::kIndexSignature.end());
  put32(out, version);
  put32(out, static_cast<std::uint32_t>(entries_.size()));

  for (const auto &e : entries_) {
    const std::size_t start = out.size();
    put32(out, e.stat.ctime_s);
    put32(out, e.stat.ctime_ns);
    put32(out, e.stat.mtime_s);
    put32(out, e.stat.mtime_ns);
    put32(out, e.stat.dev);
    put32(out, e.stat.ino);
    put32(out, e.mode);
    put32(out, e.stat.uid);
    put32(out, e.stat.gid);
    put32(out, static_cast<std::uint32_t>(e.stat.size));
    out.insert(out.end(), e.id.begin(), e.id.end());

    auto flags = static_cast<std::uint16_t>((e.stage() << 12) |
                                            std::min<std::size_t>(e.path.size(), kNameMask));
    if (e.assume_valid())
      flags |= 0x8000;
    if (e.ext_flags != 0)
      flags |= kFlagExtended;
    put16(out, flags);
    if (e.ext_flags != 0)
      put16(out, e.ext_flags);

    out.insert(out.end(), e.path.begin(), e.path.end());
    const std::size_t fixed = out.size() - start - e.path.size();
    const std::size_t padded = (fixed + e.path.size() + 8) & ~static_cast<std::size_t>(7);
    out.resize(start + padded, 0);
  }

  const oid checksum = sha1(out);
  out.insert(out.end(), checksum.begin(), checksum.end());
  fs::write_file_atomic(index_file_, out);
}

void Index::add_path(const std::filesystem::path &wd, std::string_view relpath,
                     const Repository &repo) {
  const auto full = wd / std::filesystem::path(relpath);
  const auto st = fs::lstat_path(full);
  if (!st)
    throw std::runtime_error("add_path: no such file: " + full.string());

  std::uint32_t mode = consts::kModeFile;
  std::string hex_oid;
  if (st->is_symlink()) {
    mode = consts::kModeSymlink;
    hex_oid = repo.write_blob(as_bytes(fs::read_link(full)));
  } else if (st->is_regular()) {
    mode = st->is_executable() ? consts::kModeExec : consts::kModeFile;
    hex_oid = repo.write_blob(fs::read_file(full));
  } else {
    throw std::runtime_error("add_path: not a file: " + full.string());
  }

  IndexEntry entry{};
  entry.stat = *st;
  entry.stat.mode = 0;
  entry.mode = mode;
  if (!from_hex(hex_oid, entry.id)) {
    throw std::runtime_error("write_blob produced bad hex oid");
  }
  entry.path = std::string(relpath);

  // Staging a path resolves any conflict stages for it
  remove_path(relpath);
  entries_.push_back(std::move(entry));
  sort_entries();
}

void Index::remove_path(std::string_view relpath) {
  std::erase_if(entries_, [&](const IndexEntry &e) { return e.path == relpath; });
}

void Index::add_entry(IndexEntry entry) {
  entries_.push_back(std::move(entry));
  sort_entries();
}

void Index::sort_entries() { std::ranges::stable_sort(entries_, entry_less); }

} // namespace gitstamp
