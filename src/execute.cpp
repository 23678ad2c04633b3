#include "bumv/execute.hpp"

#include "bumv/error.hpp"
#include "bumv/fs.hpp"

#include <cerrno>
#include <cstdio> // renameat2, RENAME_NOREPLACE (glibc)
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stdfs = std::filesystem;

namespace {

// rename(2) that refuses to replace an existing target where the kernel allows it
std::error_code rename_no_replace(const stdfs::path &from, const stdfs::path &to) {
#if defined(__linux__) && defined(RENAME_NOREPLACE)
  if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0)
    return {};
  const int err = errno;
  // EINVAL: filesystem without RENAME_NOREPLACE support
  if (err != EINVAL && err != ENOSYS)
    return {err, std::generic_category()};
#endif
  std::error_code ec;
  stdfs::rename(from, to, ec);
  return ec;
}

std::string describe_step(const bumv::Step &s) { return s.from + " -> " + s.to; }

} // namespace

namespace bumv {

ExecutionReport execute(const Plan &plan, const Snapshot &original, const Config &cfg,
                        Journal *journal) {
  ExecutionReport report;
  if (plan.empty())
    return report;

  // The whole plan is void if the directory changed since the list was shown
  const Snapshot current = capture_snapshot(cfg);
  if (current != original) {
    throw Error(ErrorKind::Stale,
                "the files in the directory changed while you were editing them; nothing was "
                "renamed",
                describe_difference(original, current));
  }

  const auto &root = cfg.base_path;
  const auto &steps = plan.steps();
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto &step = steps[i];
    const stdfs::path from = root / step.from;
    const stdfs::path to = root / step.to;

    if (!fs::is_regular_file(from)) {
      throw Error(ErrorKind::Precondition,
                  "the file " + step.from + " no longer exists; aborting", {describe_step(step)},
                  i);
    }
    if (fs::occupied(to)) {
      throw Error(ErrorKind::Precondition, "the file " + step.to + " already exists; aborting",
                  {describe_step(step)}, i);
    }

    try {
      fs::ensure_parent_dir(to);
    } catch (const std::runtime_error &e) {
      throw Error(ErrorKind::Os, e.what(), {describe_step(step)}, i);
    }

    if (const auto ec = rename_no_replace(from, to)) {
      if (ec == std::errc::file_exists) {
        throw Error(ErrorKind::Precondition,
                    "the file " + step.to + " already exists; aborting", {describe_step(step)}, i);
      }
      throw Error(ErrorKind::Os, "renaming " + step.from + " failed: " + ec.message(),
                  {describe_step(step)}, i);
    }

    ++report.renamed;
    if (journal)
      journal->append(i, step);
  }
  return report;
}

} // namespace bumv
