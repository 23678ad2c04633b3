#include "bumv/error.hpp"

#include <utility>

namespace bumv {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Structural:
    return "invalid edit";
  case ErrorKind::Stale:
    return "files changed";
  case ErrorKind::Planning:
    return "planning failed";
  case ErrorKind::Precondition:
    return "rename precondition failed";
  case ErrorKind::Os:
    return "rename failed";
  }
  return "error";
}

Error::Error(ErrorKind kind, const std::string &message, std::vector<std::string> details,
             std::optional<std::size_t> step)
    : std::runtime_error(message), kind_(kind), details_(std::move(details)), step_(step) {}

} // namespace bumv
