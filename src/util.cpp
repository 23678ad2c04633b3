// Small string helpers shared by the config loader, list parser and editor
#include "bumv/util.hpp"

#include <algorithm>
#include <cctype>

namespace bumv::strutil {

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

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_words(std::string_view sv) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && (sv[i] == ' ' || sv[i] == '\t'))
      ++i;
    const std::size_t start = i;
    while (i < sv.size() && sv[i] != ' ' && sv[i] != '\t')
      ++i;
    if (i > start)
      out.emplace_back(sv.substr(start, i - start));
  }
  return out;
}

std::optional<bool> parse_bool(std::string_view sv) {
  std::string s = trim(sv);
  std::ranges::transform(s, s.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  if (s == "true" || s == "yes" || s == "on" || s == "1")
    return true;
  if (s == "false" || s == "no" || s == "off" || s == "0")
    return false;
  return std::nullopt;
}

} // namespace bumv::strutil
