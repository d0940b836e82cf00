#include "gitstamp/errors.hpp"
#include "gitstamp/hash.hpp"
#include "gitstamp/index.hpp"
#include "gitstamp/repo.hpp"
#include "gitstamp/worktree.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using bytes = std::vector<std::uint8_t>;

static void put32(bytes &out, std::uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8)
    out.push_back(static_cast<std::uint8_t>(v >> shift));
}

static void put16(bytes &out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

// Fixed 62-byte part of an entry: zero stat data, mode, id, flags
static void put_entry_head(bytes &out, std::uint32_t mode, std::uint8_t id_byte,
                           std::uint16_t flags) {
  for (int i = 0; i < 6; ++i)
    put32(out, 0);
  put32(out, mode);
  for (int i = 0; i < 3; ++i)
    put32(out, 0);
  out.insert(out.end(), 20, id_byte);
  put16(out, flags);
}

static void finish(bytes &out, bool zero_trailer = false) {
  const gitstamp::oid sum = zero_trailer ? gitstamp::oid{} : gitstamp::sha1(out);
  out.insert(out.end(), sum.begin(), sum.end());
}

static void write_bytes(const fs::path &p, const bytes &b) {
  std::ofstream(p, std::ios::binary)
      .write(reinterpret_cast<const char *>(b.data()), static_cast<std::streamsize>(b.size()));
}

static bytes header(std::uint32_t version, std::uint32_t count) {
  bytes out{'D', 'I', 'R', 'C'};
  put32(out, version);
  put32(out, count);
  return out;
}

template <class E> static bool throws_on_load(const fs::path &p) {
  try {
    gitstamp::Index idx{p};
    idx.load();
  } catch (const E &) {
    return true;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitstamp_index_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // Missing index: empty, no error
    {
      gitstamp::Index idx{root / "none"};
      idx.load();
      if (!idx.entries().empty() || idx.file_stat()) {
        std::cerr << "missing index should load empty\n";
        return 1;
      }
    }

    // Version 2 written by save(), read back with stat data
    {
      gitstamp::Repository repo{root / "repo"};
      fs::create_directories(repo.root());
      repo.init();
      std::ofstream(repo.root() / "b.txt") << "bee\n";
      std::ofstream(repo.root() / "a.txt") << "ay\n";

      gitstamp::Index idx{repo.index_file()};
      idx.add_path(repo.root(), "b.txt", repo);
      idx.add_path(repo.root(), "a.txt", repo);
      idx.save();

      gitstamp::Index back{repo.index_file()};
      back.load();
      if (back.version() != 2 || back.entries().size() != 2 ||
          back.entries()[0].path != "a.txt" || back.entries()[1].path != "b.txt") {
        std::cerr << "v2 round trip lost entries or order\n";
        return 1;
      }
      const auto &e = back.entries()[1];
      if (e.stat.size != 4 || e.stat.mtime_s == 0 ||
          e.mode != gitstamp::consts::kModeFile || !back.file_stat()) {
        std::cerr << "v2 stat data not preserved\n";
        return 1;
      }
    }

    // Version 4 with prefix-compressed paths, a conflict and an optional extension
    {
      bytes b = header(4, 4);
      put_entry_head(b, gitstamp::consts::kModeFile, 0x11, 11);
      b.push_back(0);
      for (char c : std::string("dir/one.txt"))
        b.push_back(static_cast<std::uint8_t>(c));
      b.push_back(0);
      // "dir/two.txt": strip 7 ("one.txt"), append "two.txt"
      put_entry_head(b, gitstamp::consts::kModeExec, 0x22, 11);
      b.push_back(7);
      for (char c : std::string("two.txt"))
        b.push_back(static_cast<std::uint8_t>(c));
      b.push_back(0);
      // "dir/x" at stages 1 and 2
      put_entry_head(b, gitstamp::consts::kModeFile, 0x33, (1 << 12) | 5);
      b.push_back(7);
      b.push_back('x');
      b.push_back(0);
      put_entry_head(b, gitstamp::consts::kModeFile, 0x44, (2 << 12) | 5);
      b.push_back(0);
      b.push_back(0);
      // "TREE" is optional and skipped
      b.insert(b.end(), {'T', 'R', 'E', 'E'});
      put32(b, 3);
      b.insert(b.end(), {1, 2, 3});
      finish(b);
      write_bytes(root / "v4", b);

      gitstamp::Index idx{root / "v4"};
      idx.load();
      const auto &es = idx.entries();
      if (idx.version() != 4 || es.size() != 4 || es[0].path != "dir/one.txt" ||
          es[1].path != "dir/two.txt" || es[1].mode != gitstamp::consts::kModeExec ||
          es[2].path != "dir/x" || es[2].stage() != 1 || es[3].path != "dir/x" ||
          es[3].stage() != 2) {
        std::cerr << "v4 entries misparsed\n";
        return 1;
      }
      if (gitstamp::worktree::index_to_map(idx).size() != 2) {
        std::cerr << "conflict stages leaked into the stage-0 map\n";
        return 1;
      }
    }

    // Version 3 extended flags, all-zero trailer (index.skipHash)
    {
      bytes b = header(3, 1);
      put_entry_head(b, gitstamp::consts::kModeFile, 0x55, 0x4000 | 5);
      put16(b, 0x4000); // skip-worktree
      for (char c : std::string("a.txt"))
        b.push_back(static_cast<std::uint8_t>(c));
      // 64 fixed + 5 name -> padded to 72
      b.insert(b.end(), 3, 0);
      finish(b, true);
      write_bytes(root / "v3", b);

      gitstamp::Index idx{root / "v3"};
      idx.load();
      if (idx.entries().size() != 1 || !idx.entries()[0].skip_worktree() ||
          idx.entries()[0].path != "a.txt") {
        std::cerr << "v3 extended flags misparsed\n";
        return 1;
      }
    }

    // Corrupt checksum
    {
      bytes b = header(2, 0);
      finish(b);
      b.back() ^= 0xff;
      write_bytes(root / "badsum", b);
      if (!throws_on_load<gitstamp::CorruptObjectError>(root / "badsum")) {
        std::cerr << "bad checksum accepted\n";
        return 1;
      }
    }

    // Mandatory (lowercase) extension: split index
    {
      bytes b = header(2, 0);
      b.insert(b.end(), {'l', 'i', 'n', 'k'});
      put32(b, 0);
      finish(b);
      write_bytes(root / "split", b);
      if (!throws_on_load<gitstamp::UnsupportedFormatError>(root / "split")) {
        std::cerr << "mandatory extension accepted\n";
        return 1;
      }
    }

    // Unknown version
    {
      bytes b = header(5, 0);
      finish(b);
      write_bytes(root / "v5", b);
      if (!throws_on_load<gitstamp::UnsupportedFormatError>(root / "v5")) {
        std::cerr << "version 5 accepted\n";
        return 1;
      }
    }

    std::cout << "index OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
