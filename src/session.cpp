#include "bumv/session.hpp"

#include "bumv/execute.hpp"
#include "bumv/listfile.hpp"
#include "bumv/plan.hpp"
#include "bumv/rename_log.hpp"
#include "bumv/snapshot.hpp"
#include "bumv/validate.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>

namespace bumv {

Outcome bulk_rename(const Config &cfg, const EditFn &edit, const PromptFn &prompt,
                    std::ostream &out, Journal &journal) {
  const Snapshot snapshot = capture_snapshot(cfg);
  if (snapshot.empty()) {
    out << "No files to rename.\n";
    return Outcome::NothingToRename;
  }

  const auto edited = parse_list(edit(render_list(snapshot)));
  const RenameMapping mapping =
      validate(snapshot, edited, ValidateOptions{.recursive = cfg.recursive});
  if (mapping.empty()) {
    out << "No files to rename.\n";
    return Outcome::NothingToRename;
  }

  const Plan plan = build_plan(mapping, snapshot, cfg.base_path);
  for (const auto &g : plan.groups()) {
    if (const auto *cycle = std::get_if<Cycle>(&g))
      out << "Breaking cycle by temporarily renaming " << cycle->steps.front().from << " to "
          << cycle->temp << "\n";
  }

  if (cfg.assume_yes) {
    out << plan.describe() << "\n";
  } else if (!prompt(plan.describe())) {
    out << "Aborted.\n";
    return Outcome::Aborted;
  }

  execute(plan, snapshot, cfg, &journal);

  if (!cfg.no_log) {
    try {
      const auto log = write_rename_log(cfg.base_path, mapping, snapshot, std::time(nullptr));
      out << "Rename log written to " << log.string() << "\n";
    } catch (const std::runtime_error &e) {
      // the renames are done; a missing log is not worth failing the run
      std::cerr << "bumv: warning: could not write rename log: " << e.what() << "\n";
    }
  }
  out << "Files renamed successfully.\n";
  return Outcome::Renamed;
}

} // namespace bumv
