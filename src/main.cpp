#include "bumv/config.hpp"
#include "bumv/consts.hpp"
#include "bumv/editor.hpp"
#include "bumv/error.hpp"
#include "bumv/journal.hpp"
#include "bumv/session.hpp"
#include "cli/options.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char **argv) {
  bumv::Config defaults;
  try {
    if (const auto settings = bumv::settings_path())
      bumv::load_settings(*settings, defaults);
  } catch (const std::exception &e) {
    std::cerr << "bumv: " << e.what() << "\n";
    return 1;
  }

  const auto args = bumv::cli::parse_args(argc, argv, defaults);
  if (!args.error.empty()) {
    std::cerr << "bumv: " << args.error << "\n";
    bumv::cli::print_usage(std::cerr);
    return 2;
  }
  if (args.help) {
    bumv::cli::print_usage(std::cout);
    return 0;
  }
  if (args.version) {
    std::cout << bumv::consts::kProgramName << " " << bumv::consts::kVersion << "\n";
    return 0;
  }

  const bumv::TempFileEditor editor{bumv::resolve_editor(args.config)};
  bumv::MemoryJournal journal;
  try {
    bumv::bulk_rename(
        args.config, [&editor](const std::string &text) { return editor.edit(text); },
        bumv::cli::prompt_for_confirmation, std::cout, journal);
    return 0;
  } catch (const bumv::Error &e) {
    std::cerr << "bumv: " << bumv::to_string(e.kind()) << ": " << e.what() << "\n";
    for (const auto &d : e.details())
      std::cerr << "  " << d << "\n";
    if (e.during_execution()) {
      if (journal.entries().empty()) {
        std::cerr << "No files were renamed.\n";
      } else {
        std::cerr << "These renames were completed before the failure and were not undone:\n";
        for (const auto &s : journal.entries())
          std::cerr << "  " << s.from << " -> " << s.to << "\n";
      }
    }
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "bumv: " << e.what() << "\n";
    return 1;
  }
}
