#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace bumv {

// Lets the user edit text in an external editor via a temporary file
class TempFileEditor {
public:
  // `command` may carry arguments ("vim -u NONE"); it is split on whitespace
  explicit TempFileEditor(std::string command);

  // Write `content` to a fresh temp file, run the editor on it, return the
  // edited text. The temp file is removed on every path. Throws on a failed
  // spawn or a non-zero exit.
  [[nodiscard]] auto edit(std::string_view content) const -> std::string;

  // argv that would be executed for `file`
  [[nodiscard]] auto argv_for(const std::string& file) const -> std::vector<std::string>;

private:
  std::string command_;
};

} // namespace bumv
