#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bumv {

struct IgnoreRule {
  std::string pattern; // fnmatch(3) pattern, leading '!' and trailing '/' removed
  std::string base;    // root-relative directory holding the ignore file ("" for root)
  bool negated = false;
  bool dir_only = false;
  bool anchored = false; // pattern is matched against the path below `base`, not the basename
  bool any_depth = false; // pattern had a leading "**/"
};

// Accumulated .gitignore/.ignore rules; the last matching rule decides.
class IgnoreRules {
public:
  // Parse the ignore files found in root/rel_dir (missing files are fine)
  void load_dir(const std::filesystem::path& root, const std::string& rel_dir);

  // Parse one line of an ignore file located in `rel_dir`
  void add_line(std::string_view line, const std::string& rel_dir);

  [[nodiscard]] bool ignored(std::string_view rel_path, bool is_dir) const;

  [[nodiscard]] const std::vector<IgnoreRule>& rules() const { return rules_; }

private:
  std::vector<IgnoreRule> rules_;
};

} // namespace bumv
