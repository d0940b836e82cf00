#pragma once
#include "gitstamp/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gitstamp {

struct Object;

// Sorted object-id -> pack offset table from a .idx file (version 1 or 2).
class PackIndex {
public:
  static PackIndex load(const std::filesystem::path &idx_path);

  [[nodiscard]] std::optional<std::uint64_t> find(const oid &id) const;
  [[nodiscard]] std::size_t size() const { return ids_.size(); }

private:
  std::vector<oid> ids_; // sorted, as stored in the file
  std::vector<std::uint64_t> offsets_;
};

// One .pack file plus its index. Objects are read on demand.
class Pack {
public:
  // Resolves REF_DELTA bases that live outside this pack.
  using BaseLookup = std::function<Object(const oid &)>;

  Pack(std::filesystem::path pack_path, PackIndex index);

  [[nodiscard]] bool contains(const oid &id) const { return index_.find(id).has_value(); }

  // Read a whole (undeltified) object; nullopt if the id is not in this pack.
  std::optional<Object> read(const oid &id, const BaseLookup &external) const;

  [[nodiscard]] const std::filesystem::path &path() const { return pack_path_; }

private:
  struct EntryHeader {
    int type = 0;
    std::uint64_t size = 0;
    std::uint64_t data_offset = 0; // first byte after the type/size (and base) header
    std::uint64_t base_offset = 0; // OFS_DELTA
    oid base_id{};                 // REF_DELTA
  };

  void open() const;
  EntryHeader read_header(std::uint64_t offset) const;
  std::vector<std::uint8_t> inflate_at(std::uint64_t offset, std::uint64_t size) const;
  Object read_at(std::uint64_t offset, const BaseLookup &external) const;

  std::filesystem::path pack_path_;
  PackIndex index_;
  mutable std::ifstream in_;
  mutable std::uint64_t file_size_ = 0;
};

// Reconstruct an object from its base and a git delta stream.
std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta);

} // namespace gitstamp
