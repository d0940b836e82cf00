#pragma once
#include "gitstamp/hash.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gitstamp {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Compute the Git blob object id for raw bytes without writing to the object store.
// Hashes header "blob <size>\0" + data.
auto compute_blob_oid(std::span<const std::uint8_t> bytes) -> oid;

inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

// String helpers
namespace strutil {
// Strip trailing CR/LF characters in place
void rstrip_newlines(std::string &str);
// Strip leading and trailing spaces, tabs, CR and LF
auto trim(std::string_view str) -> std::string_view;
} // namespace strutil

} // namespace gitstamp
