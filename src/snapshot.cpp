#include "bumv/snapshot.hpp"

#include "bumv/hash.hpp"
#include "bumv/ignore.hpp"
#include "bumv/listfile.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <system_error>

namespace stdfs = std::filesystem;

namespace bumv {

Snapshot capture_snapshot(const Config &cfg) {
  const auto &root = cfg.base_path;
  std::error_code ec;
  if (!stdfs::is_directory(root, ec)) {
    throw std::runtime_error("not a directory: " + root.string());
  }

  IgnoreRules rules;
  if (!cfg.no_ignore)
    rules.load_dir(root, "");

  Snapshot out;
  auto it = stdfs::recursive_directory_iterator(
      root, stdfs::directory_options::skip_permission_denied, ec);
  if (ec)
    throw std::runtime_error("cannot read directory " + root.string() + ": " + ec.message());

  for (; it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throw std::runtime_error("walk failed below " + root.string() + ": " + ec.message());
    const auto &p = it->path();
    const std::string rel = p.lexically_relative(root).generic_string();
    std::error_code kind_ec;
    const bool is_dir = it->is_directory(kind_ec);

    if (has_line_break(rel)) {
      if (is_dir)
        it.disable_recursion_pending();
      continue;
    }

    if (!cfg.no_ignore) {
      const bool hidden = p.filename().string().starts_with('.');
      if (hidden || rules.ignored(rel, is_dir)) {
        if (is_dir)
          it.disable_recursion_pending();
        continue;
      }
    }
    if (is_dir) {
      if (!cfg.recursive || it->is_symlink(kind_ec))
        it.disable_recursion_pending();
      else if (!cfg.no_ignore)
        rules.load_dir(root, rel);
      continue;
    }
    if (it->is_regular_file(kind_ec))
      out.push_back(rel);
  }
  if (ec)
    throw std::runtime_error("walk failed below " + root.string() + ": " + ec.message());

  // ensure deterministic order
  std::ranges::sort(out);
  return out;
}

std::string snapshot_digest(const Snapshot &snapshot) {
  return sha1_hex(render_list(snapshot));
}

std::vector<std::string> describe_difference(const Snapshot &before, const Snapshot &after) {
  std::vector<std::string> out;
  if (before == after)
    return out;
  const std::set<std::string> a(before.begin(), before.end());
  const std::set<std::string> b(after.begin(), after.end());
  for (const auto &p : a)
    if (!b.contains(p))
      out.push_back("removed: " + p);
  for (const auto &p : b)
    if (!a.contains(p))
      out.push_back("added: " + p);
  if (out.empty())
    out.emplace_back("file order changed");
  return out;
}

} // namespace bumv
