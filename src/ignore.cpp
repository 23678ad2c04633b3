#include "bumv/ignore.hpp"

#include "bumv/consts.hpp"
#include "bumv/fs.hpp"
#include "bumv/path_entry.hpp"
#include "bumv/util.hpp"

#include <fnmatch.h>
#include <sstream>
#include <utility>

namespace {

bool glob(const std::string &pattern, std::string_view text, int flags) {
  return ::fnmatch(pattern.c_str(), std::string(text).c_str(), flags) == 0;
}

std::string_view basename_of(std::string_view rel) {
  const auto pos = rel.rfind('/');
  return pos == std::string_view::npos ? rel : rel.substr(pos + 1);
}

bool matches(const bumv::IgnoreRule &rule, std::string_view rel) {
  if (!rule.anchored)
    return glob(rule.pattern, basename_of(rel), 0);
  if (!rule.any_depth)
    return glob(rule.pattern, rel, FNM_PATHNAME);
  // "**/a/b": try every suffix that starts at a component boundary
  for (std::size_t pos = 0;;) {
    if (glob(rule.pattern, rel.substr(pos), FNM_PATHNAME))
      return true;
    const auto slash = rel.find('/', pos);
    if (slash == std::string_view::npos)
      return false;
    pos = slash + 1;
  }
}

} // namespace

namespace bumv {

void IgnoreRules::load_dir(const std::filesystem::path &root, const std::string &rel_dir) {
  const auto dir = rel_dir.empty() ? root : root / rel_dir;
  for (const auto name : {consts::kGitIgnoreFile, consts::kIgnoreFile}) {
    const auto file = dir / name;
    if (!fs::is_regular_file(file))
      continue;
    std::istringstream iss(fs::read_text(file));
    std::string line;
    while (std::getline(iss, line))
      add_line(line, rel_dir);
  }
}

void IgnoreRules::add_line(std::string_view line, const std::string &rel_dir) {
  std::string s{line};
  strutil::rstrip_newlines(s);
  // trailing spaces are insignificant unless escaped
  while (!s.empty() && s.back() == ' ' && !(s.size() > 1 && s[s.size() - 2] == '\\'))
    s.pop_back();
  if (s.empty() || s.front() == '#')
    return;

  IgnoreRule rule;
  rule.base = rel_dir;
  if (s.front() == '!') {
    rule.negated = true;
    s.erase(0, 1);
  } else if (s.starts_with("\\!") || s.starts_with("\\#")) {
    s.erase(0, 1);
  }
  if (s.ends_with("/**")) {
    s.resize(s.size() - 3);
    rule.dir_only = true;
  }
  if (!s.empty() && s.back() == '/') {
    s.pop_back();
    rule.dir_only = true;
  }
  if (s.starts_with("**/")) {
    s.erase(0, 3);
    rule.any_depth = true;
  }
  if (!s.empty() && s.front() == '/') {
    s.erase(0, 1);
    rule.anchored = true;
  }
  if (s.find('/') != std::string::npos)
    rule.anchored = true;
  if (rule.any_depth && !rule.anchored)
    rule.any_depth = false; // "**/name" is the same as "name"
  if (s.empty())
    return;
  rule.pattern = std::move(s);
  rules_.push_back(std::move(rule));
}

bool IgnoreRules::ignored(std::string_view rel_path, bool is_dir) const {
  bool result = false;
  for (const auto &rule : rules_) {
    if (rule.dir_only && !is_dir)
      continue;
    std::string_view below = rel_path;
    if (!rule.base.empty()) {
      if (!is_ancestor(rule.base, rel_path))
        continue;
      below.remove_prefix(rule.base.size() + 1);
    }
    if (matches(rule, below))
      result = !rule.negated;
  }
  return result;
}

} // namespace bumv
