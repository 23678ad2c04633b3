#include "bumv/rename_log.hpp"

#include "bumv/consts.hpp"
#include "bumv/fs.hpp"
#include "bumv/time.hpp"

#include <algorithm>
#include <stdexcept>

namespace bumv {

std::string render_rename_log(const RenameMapping &mapping, const Snapshot &snapshot) {
  std::string out{consts::kLogSnapshotLine};
  out.append(snapshot_digest(snapshot));
  out.push_back(consts::kLF);

  std::size_t width = 0;
  for (const auto &r : mapping)
    width = std::max(width, r.from.size());
  for (const auto &r : mapping) {
    out.append(r.from);
    out.append(width - r.from.size(), ' ');
    out.push_back(consts::kTab);
    out.append(r.to);
    out.push_back(consts::kLF);
  }
  return out;
}

std::filesystem::path write_rename_log(const std::filesystem::path &base,
                                       const RenameMapping &mapping, const Snapshot &snapshot,
                                       std::time_t when) {
  const std::string stem = std::string(consts::kLogPrefix) + timeutil::log_timestamp(when);
  auto path = base / (stem + std::string(consts::kLogSuffix));
  for (int n = 1; fs::occupied(path); ++n) {
    if (n > 999)
      throw std::runtime_error("no free log file name for " + stem);
    path = base / (stem + "_" + std::to_string(n) + std::string(consts::kLogSuffix));
  }
  fs::write_file_atomic(path, render_rename_log(mapping, snapshot));
  return path;
}

} // namespace bumv
