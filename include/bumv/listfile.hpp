#pragma once
#include "bumv/path_entry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bumv {

// One entry per line, each terminated by '\n'
auto render_list(const std::vector<PathEntry>& entries) -> std::string;

// Inverse of render_list for an edited file: CRLF tolerated, trailing blank
// lines dropped, interior blank lines kept (as empty entries) for the validator.
auto parse_list(std::string_view text) -> std::vector<PathEntry>;

} // namespace bumv
