#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bumv {

enum class ErrorKind : std::uint8_t {
  Structural,   // edited list rejected; nothing touched
  Stale,        // filesystem no longer matches the snapshot; nothing touched
  Planning,     // cycle could not be broken safely; nothing touched
  Precondition, // a step's source vanished or its target appeared
  Os,           // the rename itself failed
};

auto to_string(ErrorKind kind) -> const char*;

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message, std::vector<std::string> details = {},
        std::optional<std::size_t> step = std::nullopt);

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  // Offending lines or paths, one per entry
  [[nodiscard]] const std::vector<std::string>& details() const { return details_; }
  // 0-based index of the failing step (execution errors only)
  [[nodiscard]] std::optional<std::size_t> step() const { return step_; }

  // True if the filesystem may have been modified before the failure
  [[nodiscard]] bool during_execution() const {
    return kind_ == ErrorKind::Precondition || kind_ == ErrorKind::Os;
  }

private:
  ErrorKind kind_;
  std::vector<std::string> details_;
  std::optional<std::size_t> step_;
};

} // namespace bumv
