#pragma once
#include "bumv/config.hpp"
#include "bumv/journal.hpp"
#include "bumv/plan.hpp"
#include "bumv/snapshot.hpp"

#include <cstddef>

namespace bumv {

struct ExecutionReport {
  std::size_t renamed = 0; // steps performed, temporary ones included
};

/**
 * Run the plan below cfg.base_path.
 * - Re-captures the snapshot first; any difference from `original` throws
 *   Error{Stale} before anything is renamed.
 * - Before each step re-checks that the source is still a regular file and
 *   that nothing occupies the target; a failed check throws
 *   Error{Precondition}, a failed rename Error{Os}. Both carry the step index.
 * Completed steps are reported to `journal` (may be null) and are not undone
 * on failure.
 */
auto execute(const Plan& plan, const Snapshot& original, const Config& cfg,
             Journal* journal = nullptr) -> ExecutionReport;

} // namespace bumv
