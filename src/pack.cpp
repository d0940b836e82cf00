#include "gitstamp/pack.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/errors.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/object_store.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string_view>

namespace gfs = gitstamp::fs;

namespace {

enum PackObjectType : int {
  kObjCommit = 1,
  kObjTree = 2,
  kObjBlob = 3,
  kObjTag = 4,
  kObjOfsDelta = 6,
  kObjRefDelta = 7,
};

// Guards against cycles in corrupt packs; real chains are far shorter.
constexpr int kMaxDeltaChain = 10000;

std::uint32_t be32(std::span<const std::uint8_t> b, std::size_t off) {
  return (static_cast<std::uint32_t>(b[off]) << 24) |
         (static_cast<std::uint32_t>(b[off + 1]) << 16) |
         (static_cast<std::uint32_t>(b[off + 2]) << 8) | static_cast<std::uint32_t>(b[off + 3]);
}

std::uint64_t be64(std::span<const std::uint8_t> b, std::size_t off) {
  return (static_cast<std::uint64_t>(be32(b, off)) << 32) | be32(b, off + 4);
}

std::string_view type_name(int type) {
  switch (type) {
  case kObjCommit:
    return gitstamp::consts::kTypeCommit;
  case kObjTree:
    return gitstamp::consts::kTypeTree;
  case kObjBlob:
    return gitstamp::consts::kTypeBlob;
  case kObjTag:
    return gitstamp::consts::kTypeTag;
  default:
    throw gitstamp::CorruptObjectError("pack: unknown object type " + std::to_string(type));
  }
}

// Little-endian base-128 size used at the start of a delta stream.
std::uint64_t delta_size(std::span<const std::uint8_t> delta, std::size_t &pos) {
  std::uint64_t value = 0;
  int shift = 0;
  for (;;) {
    if (pos >= delta.size() || shift > 63)
      throw gitstamp::CorruptObjectError("delta: truncated size header");
    const std::uint8_t c = delta[pos++];
    value |= static_cast<std::uint64_t>(c & 0x7f) << shift;
    shift += 7;
    if ((c & 0x80) == 0)
      return value;
  }
}

} // namespace

namespace gitstamp {

// ——— PackIndex ———

PackIndex PackIndex::load(const std::filesystem::path &idx_path) {
  const auto bytes = gfs::read_file(idx_path);
  const std::span<const std::uint8_t> b{bytes};
  const std::string where = "pack index " + idx_path.filename().string();

  constexpr std::size_t kFanoutLen = 256 * 4;
  constexpr std::size_t kTrailerLen = 2 * consts::kOidRawLen;

  PackIndex idx;
  const bool v2 = b.size() >= 8 && be32(b, 0) == consts::kPackIdxMagic;
  if (v2) {
    if (be32(b, 4) != 2)
      throw UnsupportedFormatError(where + ": unsupported version " + std::to_string(be32(b, 4)));
    if (b.size() < 8 + kFanoutLen + kTrailerLen)
      throw CorruptObjectError(where + ": truncated");
    const std::size_t n = be32(b, 8 + kFanoutLen - 4);
    const std::size_t ids_off = 8 + kFanoutLen;
    const std::size_t crc_off = ids_off + (n * consts::kOidRawLen);
    const std::size_t off32_off = crc_off + (n * 4);
    const std::size_t off64_off = off32_off + (n * 4);
    if (b.size() < off64_off + kTrailerLen)
      throw CorruptObjectError(where + ": truncated");
    const std::size_t n_large = (b.size() - off64_off - kTrailerLen) / 8;

    idx.ids_.resize(n);
    idx.offsets_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
      std::memcpy(idx.ids_[i].data(), &b[ids_off + (i * consts::kOidRawLen)],
                  consts::kOidRawLen);
      const std::uint32_t off = be32(b, off32_off + (i * 4));
      if ((off & 0x80000000U) != 0) {
        const std::size_t large = off & 0x7fffffffU;
        if (large >= n_large)
          throw CorruptObjectError(where + ": bad 64-bit offset slot");
        idx.offsets_[i] = be64(b, off64_off + (large * 8));
      } else {
        idx.offsets_[i] = off;
      }
    }
  } else {
    // Version 1: fanout, then (offset, id) pairs
    if (b.size() < kFanoutLen + kTrailerLen)
      throw CorruptObjectError(where + ": truncated");
    const std::size_t n = be32(b, kFanoutLen - 4);
    constexpr std::size_t kRecLen = 4 + consts::kOidRawLen;
    if (b.size() < kFanoutLen + (n * kRecLen) + kTrailerLen)
      throw CorruptObjectError(where + ": truncated");
    idx.ids_.resize(n);
    idx.offsets_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
      const std::size_t rec = kFanoutLen + (i * kRecLen);
      idx.offsets_[i] = be32(b, rec);
      std::memcpy(idx.ids_[i].data(), &b[rec + 4], consts::kOidRawLen);
    }
  }

  if (!std::ranges::is_sorted(idx.ids_))
    throw CorruptObjectError(where + ": object ids out of order");
  return idx;
}

std::optional<std::uint64_t> PackIndex::find(const oid &id) const {
  const auto it = std::ranges::lower_bound(ids_, id);
  if (it == ids_.end() || *it != id)
    return std::nullopt;
  return offsets_[static_cast<std::size_t>(it - ids_.begin())];
}

// ——— Pack ———

Pack::Pack(std::filesystem::path pack_path, PackIndex index)
    : pack_path_(std::move(pack_path)), index_(std::move(index)) {}

void Pack::open() const {
  if (in_.is_open())
    return;
  in_.open(pack_path_, std::ios::binary);
  if (!in_)
    throw CorruptObjectError("pack: cannot open " + pack_path_.string());

  std::array<std::uint8_t, consts::kPackHeaderLen> hdr{};
  in_.read(reinterpret_cast<char *>(hdr.data()), static_cast<std::streamsize>(hdr.size()));
  if (!in_ || std::memcmp(hdr.data(), consts::kPackSignature.data(), 4) != 0)
    throw CorruptObjectError("pack: bad signature in " + pack_path_.filename().string());
  const std::uint32_t version = be32(hdr, 4);
  if (version != 2 && version != 3)
    throw UnsupportedFormatError("pack: unsupported version " + std::to_string(version));

  in_.seekg(0, std::ios::end);
  file_size_ = static_cast<std::uint64_t>(in_.tellg());
}

Pack::EntryHeader Pack::read_header(std::uint64_t offset) const {
  open();
  if (offset < consts::kPackHeaderLen || offset >= file_size_)
    throw CorruptObjectError("pack: offset out of range in " + pack_path_.filename().string());

  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset));
  auto next = [this]() -> std::uint8_t {
    const int c = in_.get();
    if (c == std::char_traits<char>::eof())
      throw CorruptObjectError("pack: truncated entry header");
    return static_cast<std::uint8_t>(c);
  };

  EntryHeader h{};
  std::uint8_t c = next();
  h.type = (c >> 4) & 0x7;
  h.size = c & 0x0f;
  int shift = 4;
  while ((c & 0x80) != 0) {
    if (shift > 57)
      throw CorruptObjectError("pack: oversized entry length");
    c = next();
    h.size |= static_cast<std::uint64_t>(c & 0x7f) << shift;
    shift += 7;
  }

  if (h.type == kObjOfsDelta) {
    // Offset encoding adds one per continuation byte so each length is unique.
    c = next();
    std::uint64_t back = c & 0x7f;
    while ((c & 0x80) != 0) {
      if (back > (UINT64_MAX >> 8))
        throw CorruptObjectError("pack: oversized delta base offset");
      c = next();
      back = ((back + 1) << 7) | (c & 0x7f);
    }
    if (back == 0 || back >= offset)
      throw CorruptObjectError("pack: delta base offset out of range");
    h.base_offset = offset - back;
  } else if (h.type == kObjRefDelta) {
    in_.read(reinterpret_cast<char *>(h.base_id.data()),
             static_cast<std::streamsize>(h.base_id.size()));
    if (!in_)
      throw CorruptObjectError("pack: truncated delta base id");
  }
  h.data_offset = static_cast<std::uint64_t>(in_.tellg());
  return h;
}

std::vector<std::uint8_t> Pack::inflate_at(std::uint64_t offset, std::uint64_t size) const {
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset));
  try {
    return gfs::z_inflate_stream(in_, static_cast<std::size_t>(size));
  } catch (const std::runtime_error &e) {
    throw CorruptObjectError("pack " + pack_path_.filename().string() + ": " + e.what());
  }
}

Object Pack::read_at(std::uint64_t offset, const BaseLookup &external) const {
  std::vector<std::vector<std::uint8_t>> deltas; // outermost first
  std::uint64_t cur = offset;
  Object base;

  for (int depth = 0;; ++depth) {
    if (depth > kMaxDeltaChain)
      throw CorruptObjectError("pack: delta chain too long in " + pack_path_.filename().string());
    const EntryHeader h = read_header(cur);
    if (h.type == kObjOfsDelta) {
      deltas.push_back(inflate_at(h.data_offset, h.size));
      cur = h.base_offset;
      continue;
    }
    if (h.type == kObjRefDelta) {
      deltas.push_back(inflate_at(h.data_offset, h.size));
      if (const auto off = index_.find(h.base_id)) {
        cur = *off;
        continue;
      }
      base = external(h.base_id);
      break;
    }
    base.type = std::string(type_name(h.type));
    base.data = inflate_at(h.data_offset, h.size);
    break;
  }

  for (auto it = deltas.rbegin(); it != deltas.rend(); ++it)
    base.data = apply_delta(base.data, *it);
  return base;
}

std::optional<Object> Pack::read(const oid &id, const BaseLookup &external) const {
  const auto off = index_.find(id);
  if (!off)
    return std::nullopt;
  return read_at(*off, external);
}

// ——— Delta ———

std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta) {
  std::size_t pos = 0;
  const std::uint64_t src_size = delta_size(delta, pos);
  const std::uint64_t dst_size = delta_size(delta, pos);
  if (src_size != base.size())
    throw CorruptObjectError("delta: base size mismatch");

  std::vector<std::uint8_t> out;
  out.reserve(static_cast<std::size_t>(dst_size));

  while (pos < delta.size()) {
    const std::uint8_t op = delta[pos++];
    if ((op & 0x80) != 0) {
      // Copy from base: bits 0-3 select offset bytes, bits 4-6 size bytes
      std::uint64_t cp_off = 0;
      std::uint64_t cp_size = 0;
      for (int i = 0; i < 4; ++i) {
        if ((op & (1U << i)) != 0) {
          if (pos >= delta.size())
            throw CorruptObjectError("delta: truncated copy offset");
          cp_off |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      for (int i = 0; i < 3; ++i) {
        if ((op & (0x10U << i)) != 0) {
          if (pos >= delta.size())
            throw CorruptObjectError("delta: truncated copy size");
          cp_size |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      if (cp_size == 0)
        cp_size = 0x10000;
      if (cp_off + cp_size > base.size())
        throw CorruptObjectError("delta: copy out of base bounds");
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(cp_off),
                 base.begin() + static_cast<std::ptrdiff_t>(cp_off + cp_size));
    } else if (op != 0) {
      if (pos + op > delta.size())
        throw CorruptObjectError("delta: truncated insert");
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(pos),
                 delta.begin() + static_cast<std::ptrdiff_t>(pos + op));
      pos += op;
    } else {
      throw CorruptObjectError("delta: reserved opcode 0");
    }
    if (out.size() > dst_size)
      throw CorruptObjectError("delta: result exceeds declared size");
  }
  if (out.size() != dst_size)
    throw CorruptObjectError("delta: result size mismatch");
  return out;
}

} // namespace gitstamp
