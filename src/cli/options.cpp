#include "cli/options.hpp"

#include "bumv/consts.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace bumv::cli {

ParseResult parse_args(int argc, char **argv, Config base) {
  ParseResult res{.config = std::move(base)};
  bool have_path = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-r" || a == "--recursive") {
      res.config.recursive = true;
    } else if (a == "-n" || a == "--no-ignore") {
      res.config.no_ignore = true;
    } else if (a == "--no-log") {
      res.config.no_log = true;
    } else if (a == "-c" || a == "--vscode" || a == "--use-vscode") {
      res.config.use_vscode = true;
    } else if (a == "-y" || a == "--yes") {
      res.config.assume_yes = true;
    } else if (a == "-h" || a == "--help") {
      res.help = true;
    } else if (a == "--version") {
      res.version = true;
    } else if (a == "--") {
      if (i + 1 < argc && !have_path) {
        res.config.base_path = argv[++i];
        have_path = true;
      }
      if (i + 1 < argc) {
        res.error = "too many arguments";
        return res;
      }
    } else if (a.size() > 1 && a[0] == '-') {
      res.error = "unknown option: " + a;
      return res;
    } else if (!have_path) {
      res.config.base_path = a;
      have_path = true;
    } else {
      res.error = "too many arguments";
      return res;
    }
  }
  return res;
}

void print_usage(std::ostream &os) {
  os << "usage: " << consts::kProgramName << " [options] [BASE_PATH]\n\n";
  os << "bumv (bulk move) - rename files with your editor: edit the names, save, close the\n"
        "editor and confirm the changes.\n\n";
  os << "options:\n";
  os << "  -r, --recursive  rename files in subdirectories too\n";
  os << "  -n, --no-ignore  list hidden files and files matched by .gitignore/.ignore\n";
  os << "      --no-log     do not write a bumv_<timestamp>.log file\n";
  os << "  -c, --vscode     use VS Code as editor\n";
  os << "  -y, --yes        rename without asking for confirmation\n";
  os << "  -h, --help       show this help\n";
  os << "      --version    show the version\n";
}

bool prompt_for_confirmation(const std::string &plan_text) {
  std::cout << plan_text << "\n\nRename: [Y/n]? " << std::flush;
  std::string reply;
  if (!std::getline(std::cin, reply))
    return false;
  while (!reply.empty() && (reply.back() == ' ' || reply.back() == '\r'))
    reply.pop_back();
  return reply.empty() || reply == "y" || reply == "Y" || reply == "yes";
}

} // namespace bumv::cli
