#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace bumv {

// A path relative to the traversal root, normalized, '/'-separated
using PathEntry = std::string;

// Lexical normalization: "./a//b/../c" -> "a/c". Empty input stays empty.
auto normalize_entry(std::string_view raw) -> PathEntry;

// Why `entry` cannot be a rename target, or nullopt if it can.
// `recursive` == false additionally requires a single path component.
auto malformed_reason(const PathEntry& entry, bool recursive) -> std::optional<std::string>;

// Names holding CR or LF cannot be written as one line of the list file
auto has_line_break(std::string_view name) -> bool;

// True if `dir` is a proper directory prefix of `entry` ("a" of "a/b", not of "ab")
auto is_ancestor(std::string_view dir, std::string_view entry) -> bool;

} // namespace bumv
