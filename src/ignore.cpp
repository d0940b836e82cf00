#include "gitstamp/ignore.hpp"

#include "gitstamp/consts.hpp"
#include "gitstamp/fs.hpp"

#include <cctype>
#include <optional>
#include <sstream>

namespace gitstamp {

namespace {

bool posix_class(std::string_view name, unsigned char c) {
  if (name == "alnum")
    return std::isalnum(c) != 0;
  if (name == "alpha")
    return std::isalpha(c) != 0;
  if (name == "blank")
    return c == ' ' || c == '\t';
  if (name == "cntrl")
    return std::iscntrl(c) != 0;
  if (name == "digit")
    return std::isdigit(c) != 0;
  if (name == "graph")
    return std::isgraph(c) != 0;
  if (name == "lower")
    return std::islower(c) != 0;
  if (name == "print")
    return std::isprint(c) != 0;
  if (name == "punct")
    return std::ispunct(c) != 0;
  if (name == "space")
    return std::isspace(c) != 0;
  if (name == "upper")
    return std::isupper(c) != 0;
  if (name == "xdigit")
    return std::isxdigit(c) != 0;
  return false;
}

// Match `c` against the bracket expression starting at p[i] == '['.
// On success `i` points past the closing ']'; nullopt for an unterminated class.
std::optional<bool> match_bracket(std::string_view p, std::size_t &i, char c) {
  std::size_t j = i + 1;
  bool negate = false;
  if (j < p.size() && (p[j] == '!' || p[j] == '^')) {
    negate = true;
    ++j;
  }
  bool matched = false;
  bool first = true;
  while (j < p.size() && (first || p[j] != ']')) {
    first = false;
    if (p[j] == '[' && j + 1 < p.size() && p[j + 1] == ':') {
      const auto close = p.find(":]", j + 2);
      if (close == std::string_view::npos)
        return std::nullopt;
      if (posix_class(p.substr(j + 2, close - j - 2), static_cast<unsigned char>(c)))
        matched = true;
      j = close + 2;
      continue;
    }
    char lo = p[j];
    if (lo == '\\' && j + 1 < p.size())
      lo = p[++j];
    ++j;
    char hi = lo;
    if (j + 1 < p.size() && p[j] == '-' && p[j + 1] != ']') {
      hi = p[j + 1];
      j += 2;
      if (hi == '\\' && j < p.size())
        hi = p[j++];
    }
    const auto uc = static_cast<unsigned char>(c);
    if (static_cast<unsigned char>(lo) <= uc && uc <= static_cast<unsigned char>(hi))
      matched = true;
  }
  if (j >= p.size())
    return std::nullopt;
  i = j + 1;
  return matched != negate;
}

bool match_from(std::string_view p, std::size_t pi, std::string_view t, std::size_t ti) {
  while (pi < p.size()) {
    const char pc = p[pi];
    if (pc == '*') {
      std::size_t q = pi;
      while (q < p.size() && p[q] == '*')
        ++q;
      const bool double_star = q - pi >= 2;
      const bool seg_start = pi == 0 || p[pi - 1] == '/';
      const bool seg_end = q == p.size() || p[q] == '/';
      if (double_star && seg_start && seg_end) {
        if (q == p.size())
          return true; // trailing "**" matches everything below
        // "**/" matches zero or more leading directories
        if (match_from(p, q + 1, t, ti))
          return true;
        for (std::size_t k = ti; k < t.size(); ++k) {
          if (t[k] == '/' && match_from(p, q + 1, t, k + 1))
            return true;
        }
        return false;
      }
      // Plain star: any run of characters within one path segment
      if (q == p.size())
        return t.find('/', ti) == std::string_view::npos;
      for (std::size_t k = ti; k <= t.size(); ++k) {
        if (match_from(p, q, t, k))
          return true;
        if (k < t.size() && t[k] == '/')
          break;
      }
      return false;
    }

    if (ti >= t.size())
      return false;
    const char tc = t[ti];
    if (pc == '?') {
      if (tc == '/')
        return false;
      ++pi;
      ++ti;
      continue;
    }
    if (pc == '[') {
      if (tc == '/')
        return false;
      const auto res = match_bracket(p, pi, tc);
      if (!res || !*res)
        return false;
      ++ti;
      continue;
    }
    char lit = pc;
    if (pc == '\\' && pi + 1 < p.size())
      lit = p[++pi];
    if (lit != tc)
      return false;
    ++pi;
    ++ti;
  }
  return ti == t.size();
}

std::string_view basename_of(std::string_view path) {
  const auto slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

bool wildmatch(std::string_view pattern, std::string_view text) {
  return match_from(pattern, 0, text, 0);
}

bool parse_ignore_line(std::string_view line, IgnorePattern &out) {
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);
  if (line.empty() || line.front() == '#')
    return false;

  // Trailing spaces are dropped unless escaped with a backslash
  while (!line.empty() && line.back() == ' ') {
    std::size_t backslashes = 0;
    for (std::size_t k = line.size() - 1; k > 0 && line[k - 1] == '\\'; --k)
      ++backslashes;
    if (backslashes % 2 == 1)
      break;
    line.remove_suffix(1);
  }

  IgnorePattern pat;
  if (line.starts_with('!')) {
    pat.negated = true;
    line.remove_prefix(1);
  } else if (line.starts_with("\\!") || line.starts_with("\\#")) {
    line.remove_prefix(1);
  }
  if (line.ends_with('/') && !line.ends_with("\\/")) {
    pat.dir_only = true;
    line.remove_suffix(1);
  }
  if (line.find('/') != std::string_view::npos) {
    pat.anchored = true;
    if (line.starts_with('/'))
      line.remove_prefix(1);
  }
  if (line.empty())
    return false;
  pat.glob = std::string(line);
  out = std::move(pat);
  return true;
}

std::vector<IgnorePattern> IgnoreRules::read_patterns(const std::filesystem::path &file) {
  std::vector<IgnorePattern> out;
  const auto text = fs::read_text(file);
  if (!text)
    return out;
  std::istringstream iss(*text);
  std::string line;
  while (std::getline(iss, line)) {
    IgnorePattern pat;
    if (parse_ignore_line(line, pat))
      out.push_back(std::move(pat));
  }
  return out;
}

void IgnoreRules::add_global_file(const std::filesystem::path &file) {
  globals_.push_back(Frame{.base = "", .patterns = read_patterns(file)});
}

void IgnoreRules::push_directory(const std::filesystem::path &abs_dir, const std::string &rel_dir) {
  frames_.push_back(Frame{.base = rel_dir, .patterns = read_patterns(abs_dir / consts::kGitIgnore)});
}

void IgnoreRules::pop_directory() {
  if (!frames_.empty())
    frames_.pop_back();
}

bool IgnoreRules::is_ignored(std::string_view rel_path, bool is_dir) const {
  auto decide = [&](const Frame &frame) -> std::optional<bool> {
    std::string_view sub = rel_path;
    if (!frame.base.empty()) {
      if (!sub.starts_with(frame.base) || sub.size() <= frame.base.size() ||
          sub[frame.base.size()] != '/')
        return std::nullopt;
      sub.remove_prefix(frame.base.size() + 1);
    }
    for (auto it = frame.patterns.rbegin(); it != frame.patterns.rend(); ++it) {
      if (it->dir_only && !is_dir)
        continue;
      const bool hit = it->anchored ? wildmatch(it->glob, sub) : wildmatch(it->glob, basename_of(sub));
      if (hit)
        return !it->negated;
    }
    return std::nullopt;
  };

  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (const auto d = decide(*it))
      return *d;
  }
  for (auto it = globals_.rbegin(); it != globals_.rend(); ++it) {
    if (const auto d = decide(*it))
      return *d;
  }
  return false;
}

} // namespace gitstamp
