#pragma once
#include <stdexcept>
#include <string>

namespace gitstamp {

// Base for every failure raised while reading or stamping a repository.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The directory has no recognizable repository metadata.
class RepositoryNotFoundError : public Error {
public:
  using Error::Error;
};

// The repository exists but HEAD does not resolve to a commit
// (unborn branch, dangling or malformed HEAD).
class HeadUnresolvedError : public Error {
public:
  using Error::Error;
};

// Objects, packs, refs or the index are missing or malformed.
class CorruptObjectError : public Error {
public:
  using Error::Error;
};

// Valid repository data in a format this library does not read
// (sha256 object format, split index, ...).
class UnsupportedFormatError : public Error {
public:
  using Error::Error;
};

} // namespace gitstamp
