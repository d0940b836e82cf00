#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gitstamp {

struct Identity {
  std::string name;
  std::string email;
};

// Read-only view of a git config file ($GIT_DIR/config, ~/.gitconfig).
// Keys are addressed as "section.key" or "section.subsection.key";
// section and key names are case-insensitive, subsections are not.
class GitConfig {
public:
  GitConfig() = default;

  // Missing file yields an empty config. Malformed lines throw CorruptObjectError.
  static GitConfig load(const std::filesystem::path &file);
  static GitConfig parse(std::string_view text);

  // Last value wins, as in git. Valueless keys ("[core] bare") read as "true".
  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
  [[nodiscard]] bool get_bool(std::string_view key, bool fallback) const;
  [[nodiscard]] long get_int(std::string_view key, long fallback) const;

  [[nodiscard]] bool empty() const { return values_.empty(); }

private:
  static std::string normalize_key(std::string_view key);

  std::map<std::string, std::string> values_;
};

// user.name / user.email from the repository config (empty fields if missing)
Identity load_identity(const GitConfig &config);

} // namespace gitstamp
