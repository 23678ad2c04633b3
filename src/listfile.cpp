#include "bumv/listfile.hpp"

#include "bumv/consts.hpp"
#include "bumv/util.hpp"

#include <utility>

namespace bumv {

std::string render_list(const std::vector<PathEntry> &entries) {
  std::string out;
  for (const auto &e : entries) {
    out.append(e);
    out.push_back(consts::kLF);
  }
  return out;
}

std::vector<PathEntry> parse_list(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find(consts::kLF, start);
    if (end == std::string_view::npos)
      end = text.size();
    std::string line{text.substr(start, end - start)};
    strutil::rstrip_newlines(line);
    lines.push_back(std::move(line));
    start = end + 1;
  }
  // only truly empty lines: " " is a valid file name
  while (!lines.empty() && lines.back().empty())
    lines.pop_back();

  std::vector<PathEntry> out;
  out.reserve(lines.size());
  for (const auto &l : lines)
    out.push_back(normalize_entry(l));
  return out;
}

} // namespace bumv
