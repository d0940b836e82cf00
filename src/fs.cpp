#include "gitstamp/fs.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <zlib.h>

namespace gitstamp::fs {

bool FileStat::is_regular() const { return S_ISREG(mode); }
bool FileStat::is_symlink() const { return S_ISLNK(mode); }
bool FileStat::is_directory() const { return S_ISDIR(mode); }
bool FileStat::is_executable() const { return (mode & S_IXUSR) != 0; }

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_directory(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

bool is_regular_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::optional<FileStat> lstat_path(const std::filesystem::path &p) {
  struct stat st {};
  if (::lstat(p.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR)
      return std::nullopt;
    throw std::runtime_error("lstat failed: " + p.string() + ": " + std::strerror(errno));
  }
  // Index stat fields are 32-bit; git truncates the same way.
  FileStat out{};
  out.ctime_s = static_cast<std::uint32_t>(st.st_ctim.tv_sec);
  out.ctime_ns = static_cast<std::uint32_t>(st.st_ctim.tv_nsec);
  out.mtime_s = static_cast<std::uint32_t>(st.st_mtim.tv_sec);
  out.mtime_ns = static_cast<std::uint32_t>(st.st_mtim.tv_nsec);
  out.dev = static_cast<std::uint32_t>(st.st_dev);
  out.ino = static_cast<std::uint32_t>(st.st_ino);
  out.mode = static_cast<std::uint32_t>(st.st_mode);
  out.uid = static_cast<std::uint32_t>(st.st_uid);
  out.gid = static_cast<std::uint32_t>(st.st_gid);
  out.size = static_cast<std::uint64_t>(st.st_size);
  return out;
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

std::optional<std::string> read_text(const std::filesystem::path &p) {
  if (!fs::is_regular_file(p))
    return std::nullopt;
  auto bytes = fs::read_file(p);
  return std::string(bytes.begin(), bytes.end());
}

std::string read_link(const std::filesystem::path &p) {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(p, ec);
  if (ec)
    throw std::runtime_error("readlink failed: " + p.string() + ": " + ec.message());
  return target.string();
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::size_t cap = data.size() * 3;
  cap = std::max<size_t>(cap, 64);
  for (int i = 0; i < 16; ++i) {
    std::vector<std::uint8_t> out(cap);
    auto destLen = static_cast<uLongf>(out.size());
    const int rc = uncompress(out.data(), &destLen, reinterpret_cast<const Bytef *>(data.data()),
                              static_cast<uLong>(data.size()));
    if (rc == Z_OK) {
      out.resize(destLen);
      return out;
    }
    if (rc == Z_BUF_ERROR) {
      cap *= 2;
      continue;
    }
    throw std::runtime_error("zlib uncompress failed");
  }
  throw std::runtime_error("zlib uncompress overflow");
}

std::vector<std::uint8_t> z_inflate_stream(std::istream &in, std::size_t expected_size) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  // Leave one spare byte so trailing garbage past expected_size is detected.
  std::vector<std::uint8_t> out(expected_size + 1);
  std::array<char, 16384> chunk{};
  zs.next_out = out.data();
  zs.avail_out = static_cast<uInt>(out.size());

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0) {
      in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const auto got = in.gcount();
      if (got <= 0) {
        inflateEnd(&zs);
        throw std::runtime_error("zlib stream truncated");
      }
      zs.next_in = reinterpret_cast<Bytef *>(chunk.data());
      zs.avail_in = static_cast<uInt>(got);
      in.clear();
    }
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib inflate failed");
    }
    if (rc == Z_OK && zs.avail_out == 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib stream longer than declared size");
    }
  }
  const std::size_t produced = zs.total_out;
  inflateEnd(&zs);
  if (produced != expected_size)
    throw std::runtime_error("zlib stream size mismatch");
  out.resize(produced);
  return out;
}

} // namespace gitstamp::fs
