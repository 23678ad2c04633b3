#include "bumv/path_entry.hpp"

#include "bumv/consts.hpp"

#include <filesystem>

namespace bumv {

PathEntry normalize_entry(std::string_view raw) {
  if (raw.empty())
    return {};
  std::string s = std::filesystem::path(raw).lexically_normal().generic_string();
  // lexically_normal keeps a leading "./" only for "." itself; strip it anyway
  while (s.starts_with("./"))
    s.erase(0, 2);
  return s;
}

std::optional<std::string> malformed_reason(const PathEntry &entry, bool recursive) {
  if (entry.empty())
    return "empty line";
  if (entry.find(consts::kNul) != std::string::npos)
    return "contains a NUL byte";
  if (has_line_break(entry))
    return "contains a line break";
  const std::filesystem::path p{entry};
  if (p.is_absolute() || entry.front() == '/')
    return "absolute path";
  if (entry == "." || entry == "..")
    return "names the root directory";
  if (entry.starts_with("../"))
    return "escapes the base directory";
  if (entry.back() == '/')
    return "names a directory";
  if (!recursive && entry.find('/') != std::string::npos)
    return "moves the file into a subdirectory (use --recursive)";
  return std::nullopt;
}

bool has_line_break(std::string_view name) {
  return name.find_first_of("\r\n") != std::string_view::npos;
}

bool is_ancestor(std::string_view dir, std::string_view entry) {
  return entry.size() > dir.size() && entry.starts_with(dir) && entry[dir.size()] == '/';
}

} // namespace bumv
