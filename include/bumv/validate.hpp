#pragma once
#include "bumv/path_entry.hpp"
#include "bumv/snapshot.hpp"

#include <cstddef>
#include <vector>

namespace bumv {

struct Rename {
  std::size_t line; // 1-based line in the edited list
  PathEntry from;
  PathEntry to;
};

// Changed lines only, in line order. Sources are unique (snapshot) and
// targets are unique (validated), so this is a partial injective function.
using RenameMapping = std::vector<Rename>;

struct ValidateOptions {
  bool recursive = false;
};

/**
 * Check an edited list against the snapshot it was rendered from and return
 * the rename mapping. Performs no filesystem I/O.
 * Throws bumv::Error{ErrorKind::Structural} listing every offending line of
 * the first failing check:
 *   1. line count differs
 *   2. two changed lines share a target
 *   3. a changed line targets a file whose own line is unchanged
 *   4. a target is malformed (empty, absolute, outside the base), or needs a
 *      directory where a listed file is before or after the run
 */
auto validate(const Snapshot& snapshot, const std::vector<PathEntry>& edited,
              const ValidateOptions& options) -> RenameMapping;

} // namespace bumv
