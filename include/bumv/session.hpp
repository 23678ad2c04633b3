#pragma once
#include "bumv/config.hpp"
#include "bumv/journal.hpp"

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace bumv {

enum class Outcome : std::uint8_t { NothingToRename, Aborted, Renamed };

// Receives the rendered list, returns the edited text
using EditFn = std::function<std::string(const std::string&)>;
// Receives the "old -> new" plan, returns true to go ahead
using PromptFn = std::function<bool(const std::string&)>;

/**
 * One complete run: snapshot, edit, validate, plan, confirm, execute, log.
 * `edit` and `prompt` are parameters so the flow can be driven without a
 * terminal. Errors propagate as bumv::Error (engine) or std::runtime_error
 * (I/O, editor); completed renames are in `journal`.
 */
auto bulk_rename(const Config& cfg, const EditFn& edit, const PromptFn& prompt,
                 std::ostream& out, Journal& journal) -> Outcome;

} // namespace bumv
