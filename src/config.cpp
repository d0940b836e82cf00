#include "gitstamp/config.hpp"

#include "gitstamp/errors.hpp"
#include "gitstamp/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <string_view>

namespace {

std::string lower(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool is_key_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

// Cursor over the whole file so values can continue across lines.
struct Cursor {
  std::string_view text;
  std::size_t pos = 0;
  int line = 1;

  [[nodiscard]] bool done() const { return pos >= text.size(); }
  [[nodiscard]] char peek() const { return done() ? '\n' : text[pos]; }
  char next() {
    const char c = text[pos++];
    if (c == '\n')
      ++line;
    return c;
  }
  void skip_blanks() {
    while (!done() && (peek() == ' ' || peek() == '\t' || peek() == '\r'))
      ++pos;
  }
  void skip_line() {
    while (!done() && next() != '\n') {
    }
  }
};

[[noreturn]] void fail(const Cursor &cur, std::string_view what) {
  throw gitstamp::CorruptObjectError("config line " + std::to_string(cur.line) + ": " +
                                     std::string(what));
}

std::string parse_section(Cursor &cur) {
  cur.next(); // '['
  std::string section;
  while (!cur.done() && (is_key_char(cur.peek()) || cur.peek() == '.'))
    section.push_back(cur.next());
  if (section.empty())
    fail(cur, "empty section name");

  // Legacy [section.sub] form: subsection is lowercased by git.
  std::string result;
  if (const auto dot = section.find('.'); dot != std::string::npos) {
    result = lower(section.substr(0, dot)) + "." + lower(section.substr(dot + 1));
  } else {
    result = lower(section);
  }

  cur.skip_blanks();
  if (cur.peek() == '"') {
    cur.next();
    std::string sub;
    for (;;) {
      if (cur.done() || cur.peek() == '\n')
        fail(cur, "unterminated subsection");
      char c = cur.next();
      if (c == '"')
        break;
      if (c == '\\') {
        if (cur.done())
          fail(cur, "unterminated subsection");
        c = cur.next();
      }
      sub.push_back(c);
    }
    result += "." + sub;
  }
  if (cur.peek() != ']')
    fail(cur, "expected ']'");
  cur.next();
  cur.skip_line(); // trailing comment, if any
  return result;
}

std::string parse_value(Cursor &cur) {
  std::string value;
  std::size_t keep = 0; // length without trailing unquoted whitespace
  bool quoted = false;
  cur.skip_blanks();
  while (!cur.done()) {
    const char c = cur.next();
    if (c == '\n') {
      if (quoted)
        fail(cur, "unterminated quote");
      break;
    }
    if (!quoted && (c == '#' || c == ';')) {
      cur.skip_line();
      break;
    }
    if (c == '"') {
      quoted = !quoted;
      keep = value.size();
      continue;
    }
    if (c == '\\') {
      if (cur.done())
        fail(cur, "dangling escape");
      const char e = cur.next();
      switch (e) {
      case '\n':
        continue; // line continuation
      case 'n':
        value.push_back('\n');
        break;
      case 't':
        value.push_back('\t');
        break;
      case 'b':
        if (!value.empty())
          value.pop_back();
        break;
      case '"':
      case '\\':
        value.push_back(e);
        break;
      default:
        fail(cur, "invalid escape");
      }
      keep = value.size();
      continue;
    }
    value.push_back(c);
    if (quoted || (c != ' ' && c != '\t' && c != '\r'))
      keep = value.size();
  }
  value.resize(keep);
  return value;
}

} // namespace

namespace gitstamp {

GitConfig GitConfig::load(const std::filesystem::path &file) {
  const auto text = fs::read_text(file);
  if (!text)
    return GitConfig{};
  return parse(*text);
}

GitConfig GitConfig::parse(std::string_view text) {
  GitConfig cfg;
  Cursor cur{.text = text};
  std::string section;

  while (!cur.done()) {
    cur.skip_blanks();
    const char c = cur.peek();
    if (c == '\n') {
      cur.next();
      continue;
    }
    if (c == '#' || c == ';') {
      cur.skip_line();
      continue;
    }
    if (c == '[') {
      section = parse_section(cur);
      continue;
    }
    if (section.empty())
      fail(cur, "key outside of a section");

    std::string name;
    while (!cur.done() && is_key_char(cur.peek()))
      name.push_back(cur.next());
    if (name.empty() || std::isalpha(static_cast<unsigned char>(name.front())) == 0)
      fail(cur, "invalid key name");

    cur.skip_blanks();
    std::string value = "true";
    if (cur.peek() == '=') {
      cur.next();
      value = parse_value(cur);
    } else if (cur.peek() == '#' || cur.peek() == ';' || cur.peek() == '\n') {
      cur.skip_line();
    } else {
      fail(cur, "expected '='");
    }
    cfg.values_[section + "." + lower(name)] = std::move(value);
  }
  return cfg;
}

std::string GitConfig::normalize_key(std::string_view key) {
  const auto first = key.find('.');
  const auto last = key.rfind('.');
  if (first == std::string_view::npos)
    return lower(key);
  if (first == last)
    return lower(key);
  return lower(key.substr(0, first)) + std::string(key.substr(first, last - first)) +
         lower(key.substr(last));
}

std::optional<std::string> GitConfig::get(std::string_view key) const {
  const auto it = values_.find(normalize_key(key));
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

bool GitConfig::get_bool(std::string_view key, bool fallback) const {
  const auto v = get(key);
  if (!v)
    return fallback;
  const std::string s = lower(*v);
  if (s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "false" || s == "no" || s == "off" || s.empty())
    return false;
  long n = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    throw CorruptObjectError("bad boolean config value for " + std::string(key) + ": " + *v);
  return n != 0;
}

long GitConfig::get_int(std::string_view key, long fallback) const {
  const auto v = get(key);
  if (!v)
    return fallback;
  std::string s = lower(*v);
  long scale = 1;
  if (!s.empty()) {
    switch (s.back()) {
    case 'k':
      scale = 1024;
      break;
    case 'm':
      scale = 1024L * 1024;
      break;
    case 'g':
      scale = 1024L * 1024 * 1024;
      break;
    default:
      break;
    }
    if (scale != 1)
      s.pop_back();
  }
  long n = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
    throw CorruptObjectError("bad numeric config value for " + std::string(key) + ": " + *v);
  if (n > LONG_MAX / scale || n < LONG_MIN / scale)
    throw CorruptObjectError("numeric config value out of range for " + std::string(key) + ": " + *v);
  return n * scale;
}

Identity load_identity(const GitConfig &config) {
  return Identity{.name = config.get("user.name").value_or(""),
                  .email = config.get("user.email").value_or("")};
}

} // namespace gitstamp
