#pragma once
#include "gitstamp/hash.hpp"
#include "gitstamp/pack.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstamp {

struct Object {
  std::string type;               // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

// Loose objects under `objects_dir`, its packs, and alternate object directories.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir,
                       std::vector<std::filesystem::path> extra_alternates = {});

  // Read and decompress an object. Throws CorruptObjectError if missing or malformed.
  Object read(std::string_view hex_oid) const;
  Object read(const oid &id) const;

  [[nodiscard]] bool contains(const oid &id) const;

  // Write a loose object with given type/payload. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  // Get filesystem path of the loose object for a binary oid.
  std::filesystem::path path_for_oid(const oid &object_id) const;

  [[nodiscard]] const std::filesystem::path &objects_dir() const { return objects_dir_; }

private:
  std::optional<Object> read_loose(const std::filesystem::path &dir, const oid &id) const;
  std::optional<Object> read_packed(const oid &id) const;
  void load_sources() const;

  std::filesystem::path objects_dir_;
  std::vector<std::filesystem::path> extra_alternates_;

  // Discovered lazily on first lookup
  mutable bool loaded_ = false;
  mutable std::vector<std::filesystem::path> loose_dirs_; // objects_dir_ first
  mutable std::vector<std::unique_ptr<Pack>> packs_;
};

} // namespace gitstamp
