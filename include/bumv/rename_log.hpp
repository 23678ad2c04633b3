#pragma once
#include "bumv/snapshot.hpp"
#include "bumv/validate.hpp"

#include <ctime>
#include <filesystem>
#include <string>

namespace bumv {

// "# snapshot <sha1>" followed by "old<TAB>new" lines, `old` padded to a common width
auto render_rename_log(const RenameMapping& mapping, const Snapshot& snapshot) -> std::string;

// Write bumv_<timestamp>.log into `base`; returns the path written.
// Never overwrites an existing log (a numeric suffix is added instead).
auto write_rename_log(const std::filesystem::path& base, const RenameMapping& mapping,
                      const Snapshot& snapshot, std::time_t when) -> std::filesystem::path;

} // namespace bumv
