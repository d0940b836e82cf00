#include "gitstamp/object_store.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/errors.hpp"
#include "gitstamp/fs.hpp"
#include "gitstamp/util.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace gfs = gitstamp::fs;

namespace gitstamp {

ObjectStore::ObjectStore(std::filesystem::path objects_dir,
                         std::vector<std::filesystem::path> extra_alternates)
    : objects_dir_(std::move(objects_dir)), extra_alternates_(std::move(extra_alternates)) {}

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

void ObjectStore::load_sources() const {
  if (loaded_)
    return;
  loaded_ = true;

  loose_dirs_.push_back(objects_dir_);
  // objects/info/alternates: one directory per line, relative to objects_dir_
  if (const auto text = gfs::read_text(objects_dir_ / consts::kInfoDir / consts::kAlternates)) {
    std::istringstream iss(*text);
    std::string line;
    while (std::getline(iss, line)) {
      const auto entry = strutil::trim(line);
      if (entry.empty() || entry.front() == '#')
        continue;
      std::filesystem::path alt{std::string(entry)};
      if (alt.is_relative())
        alt = objects_dir_ / alt;
      loose_dirs_.push_back(alt.lexically_normal());
    }
  }
  loose_dirs_.insert(loose_dirs_.end(), extra_alternates_.begin(), extra_alternates_.end());

  for (const auto &dir : loose_dirs_) {
    const auto pack_dir = dir / consts::kPackDir;
    if (!gfs::is_directory(pack_dir))
      continue;
    std::vector<std::filesystem::path> idx_files;
    for (const auto &entry : std::filesystem::directory_iterator(pack_dir)) {
      if (entry.path().extension() == ".idx")
        idx_files.push_back(entry.path());
    }
    // Directory order is unspecified; keep lookups deterministic
    std::ranges::sort(idx_files);
    for (const auto &idx_path : idx_files) {
      auto pack_path = idx_path;
      pack_path.replace_extension(".pack");
      if (!gfs::exists(pack_path))
        continue; // half-written pack; git ignores it too
      packs_.push_back(std::make_unique<Pack>(pack_path, PackIndex::load(idx_path)));
    }
  }
}

std::optional<Object> ObjectStore::read_loose(const std::filesystem::path &dir,
                                              const oid &id) const {
  const std::string hex = to_hex(id);
  const auto path = dir / hex.substr(0, consts::kFanoutDirHexLen) /
                    hex.substr(consts::kFanoutDirHexLen);
  if (!gfs::exists(path))
    return std::nullopt;

  std::vector<std::uint8_t> store;
  try {
    store = gfs::z_decompress(gfs::read_file(path));
  } catch (const std::runtime_error &e) {
    throw CorruptObjectError("object " + hex + ": " + e.what());
  }

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw CorruptObjectError("object " + hex + ": invalid header");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw CorruptObjectError("object " + hex + ": invalid header");
  }
  std::string type(store.begin(), it_space);
  const std::string size_str(it_space + 1, it_nul);
  std::size_t declared = 0;
  const auto [ptr, ec] =
      std::from_chars(size_str.data(), size_str.data() + size_str.size(), declared);
  const std::size_t payload_off = (it_nul - store.begin()) + 1;
  if (ec != std::errc{} || ptr != size_str.data() + size_str.size() ||
      declared != store.size() - payload_off) {
    throw CorruptObjectError("object " + hex + ": size mismatch");
  }
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

std::optional<Object> ObjectStore::read_packed(const oid &id) const {
  const Pack::BaseLookup external = [this](const oid &base) { return read(base); };
  for (const auto &pack : packs_) {
    if (auto obj = pack->read(id, external))
      return obj;
  }
  return std::nullopt;
}

Object ObjectStore::read(const oid &id) const {
  load_sources();
  for (const auto &dir : loose_dirs_) {
    if (auto obj = read_loose(dir, id))
      return std::move(*obj);
  }
  if (auto obj = read_packed(id))
    return std::move(*obj);
  throw CorruptObjectError("object not found: " + to_hex(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw CorruptObjectError("object_store: bad oid hex: " + std::string(hex_oid));
  }
  return read(id);
}

bool ObjectStore::contains(const oid &id) const {
  load_sources();
  const std::string hex = to_hex(id);
  for (const auto &dir : loose_dirs_) {
    if (gfs::exists(dir / hex.substr(0, consts::kFanoutDirHexLen) /
                    hex.substr(consts::kFanoutDirHexLen)))
      return true;
  }
  return std::ranges::any_of(packs_, [&](const auto &pack) { return pack->contains(id); });
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());

  oid store_id = sha1(store);
  auto path = path_for_oid(store_id);
  if (!gfs::exists(path)) {
    auto compressed = gfs::z_compress(store);
    gfs::write_file_atomic(path, compressed);
  }
  return to_hex(store_id);
}

} // namespace gitstamp
