#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bumv::strutil {

// Strip trailing CR/LF characters in place
void rstrip_newlines(std::string& str);

// Trim spaces/tabs on both ends (and a trailing CR)
auto trim(std::string_view sv) -> std::string;

// Split on runs of spaces/tabs; empty fields are dropped
auto split_words(std::string_view sv) -> std::vector<std::string>;

// "true/yes/on/1" and "false/no/off/0", case-insensitive; nullopt otherwise
auto parse_bool(std::string_view sv) -> std::optional<bool>;

} // namespace bumv::strutil
