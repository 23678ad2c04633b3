#pragma once
#include "bumv/config.hpp"
#include "bumv/path_entry.hpp"

#include <string>
#include <vector>

namespace bumv {

// Ordered, unique list of regular files below Config::base_path
using Snapshot = std::vector<PathEntry>;

// Walk the base path honouring recursive/no_ignore; result is sorted.
auto capture_snapshot(const Config& cfg) -> Snapshot;

// 40-hex SHA-1 of the rendered list
auto snapshot_digest(const Snapshot& snapshot) -> std::string;

// Human-readable "added: x" / "removed: y" lines; empty if identical
auto describe_difference(const Snapshot& before, const Snapshot& after)
    -> std::vector<std::string>;

} // namespace bumv
