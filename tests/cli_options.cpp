#include "cli/options.hpp"

#include "scratch.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using testutil::expect;

namespace {

bumv::cli::ParseResult parse(std::vector<std::string> args, bumv::Config base = {}) {
  args.insert(args.begin(), "bumv");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  return bumv::cli::parse_args(static_cast<int>(argv.size()), argv.data(), std::move(base));
}

} // namespace

int main() {
  try {
    {
      const auto r = parse({});
      expect(r.error.empty() && !r.help, "no arguments");
      expect(r.config.base_path == ".", "default base path");
      expect(!r.config.recursive && !r.config.no_ignore, "default flags");
    }
    {
      const auto r = parse({"-r", "-n", "--no-log", "-c", "-y", "photos"});
      expect(r.error.empty(), "short flags accepted");
      expect(r.config.recursive && r.config.no_ignore && r.config.no_log &&
                 r.config.use_vscode && r.config.assume_yes,
             "short flags applied");
      expect(r.config.base_path == "photos", "base path");
    }
    {
      const auto r = parse({"--recursive", "--no-ignore", "--vscode", "--yes"});
      expect(r.config.recursive && r.config.no_ignore && r.config.use_vscode &&
                 r.config.assume_yes,
             "long flags applied");
    }
    {
      bumv::Config base;
      base.recursive = true;
      base.editor = "vim";
      const auto r = parse({"dir"}, base);
      expect(r.config.recursive && r.config.editor == "vim", "settings survive parsing");
    }
    {
      const auto r = parse({"--", "-odd-dir"});
      expect(r.error.empty() && r.config.base_path == "-odd-dir", "path after --");
    }
    expect(parse({"--help"}).help, "--help");
    expect(parse({"--version"}).version, "--version");
    expect(!parse({"--bogus"}).error.empty(), "unknown option rejected");
    expect(!parse({"a", "b"}).error.empty(), "second path rejected");

    std::ostringstream usage;
    bumv::cli::print_usage(usage);
    expect(usage.str().find("--recursive") != std::string::npos, "usage lists flags");

    std::cout << "cli options test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
