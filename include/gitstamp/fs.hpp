#pragma once
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gitstamp::fs {

// Subset of lstat(2) that the index caches per entry.
struct FileStat {
  std::uint32_t ctime_s{};
  std::uint32_t ctime_ns{};
  std::uint32_t mtime_s{};
  std::uint32_t mtime_ns{};
  std::uint32_t dev{};
  std::uint32_t ino{};
  std::uint32_t mode{}; // raw st_mode
  std::uint32_t uid{};
  std::uint32_t gid{};
  std::uint64_t size{};

  [[nodiscard]] bool is_regular() const;
  [[nodiscard]] bool is_symlink() const;
  [[nodiscard]] bool is_directory() const;
  [[nodiscard]] bool is_executable() const;
};

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);
bool is_regular_file(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

// lstat(2) without following symlinks; nullopt if the path does not exist.
std::optional<FileStat> lstat_path(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
// Whole file as text, or nullopt if it does not exist.
std::optional<std::string> read_text(const std::filesystem::path& p);
// Symlink target exactly as stored (not resolved).
std::string read_link(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// Inflate one zlib stream starting at the current position of `in`.
// The stream must decode to exactly `expected_size` bytes.
std::vector<std::uint8_t> z_inflate_stream(std::istream& in, std::size_t expected_size);

} // namespace gitstamp::fs
