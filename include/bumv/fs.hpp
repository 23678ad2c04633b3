#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace bumv::fs {

bool exists(const std::filesystem::path& p);
// True if anything (file, directory, dangling symlink) occupies `p`
bool occupied(const std::filesystem::path& p);
bool is_regular_file(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::string read_text(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::string_view data);

} // namespace bumv::fs
