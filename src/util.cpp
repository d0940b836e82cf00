// Utility helpers for hex and object-id computations
#include "gitstamp/util.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/hash.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace gitstamp {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

oid compute_blob_oid(std::span<const std::uint8_t> bytes) {
  const std::string hdr = object_header(consts::kTypeBlob, bytes.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + bytes.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), bytes.begin(), bytes.end());
  return sha1(store);
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string_view trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return sv;
}

} // namespace strutil

} // namespace gitstamp
