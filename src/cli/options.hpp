#pragma once
#include "bumv/config.hpp"

#include <ostream>
#include <string>

namespace bumv::cli {

struct ParseResult {
  Config config;
  bool help = false;
  bool version = false;
  std::string error; // non-empty on a usage error
};

// Apply command-line flags on top of `base` (defaults + settings file)
auto parse_args(int argc, char **argv, Config base) -> ParseResult;

void print_usage(std::ostream& os);

// Show the plan and ask "Rename: [Y/n]?" on the terminal
bool prompt_for_confirmation(const std::string& plan_text);

} // namespace bumv::cli
