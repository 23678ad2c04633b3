#include "bumv/ignore.hpp"

#include "scratch.hpp"

#include <iostream>

using testutil::expect;

int main() {
  try {
    {
      bumv::IgnoreRules rules;
      rules.add_line("# comment", "");
      rules.add_line("", "");
      rules.add_line("*.log", "");
      rules.add_line("!keep.log", "");
      expect(rules.rules().size() == 2, "comments and blank lines skipped");
      expect(rules.ignored("a.log", false), "*.log matches at root");
      expect(rules.ignored("x/y/a.log", false), "*.log matches at any depth");
      expect(!rules.ignored("keep.log", false), "negation re-includes");
      expect(!rules.ignored("a.txt", false), "unrelated file kept");
    }
    {
      bumv::IgnoreRules rules;
      rules.add_line("build/", "");
      expect(rules.ignored("build", true), "dir-only pattern matches a directory");
      expect(!rules.ignored("build", false), "dir-only pattern skips files");
      expect(rules.ignored("src/build", true), "dir-only pattern at any depth");
    }
    {
      bumv::IgnoreRules rules;
      rules.add_line("/top.txt", "");
      rules.add_line("docs/*.md", "");
      expect(rules.ignored("top.txt", false), "anchored at root");
      expect(!rules.ignored("sub/top.txt", false), "anchored pattern not at depth");
      expect(rules.ignored("docs/a.md", false), "slash pattern anchored");
      expect(!rules.ignored("docs/sub/a.md", false), "* does not cross '/'");
      expect(!rules.ignored("x/docs/a.md", false), "slash pattern not at depth");
    }
    {
      bumv::IgnoreRules rules;
      rules.add_line("**/gen/*.c", "");
      rules.add_line("**/cache", "");
      expect(rules.ignored("gen/a.c", false), "**/ matches at root");
      expect(rules.ignored("src/deep/gen/a.c", false), "**/ matches below");
      expect(rules.ignored("x/cache", true), "**/name behaves like name");
    }
    {
      bumv::IgnoreRules rules;
      rules.add_line("*.tmp\r", "sub");
      expect(rules.ignored("sub/x.tmp", false), "rule applies below its directory");
      expect(rules.ignored("sub/deeper/x.tmp", false), "and deeper");
      expect(!rules.ignored("x.tmp", false), "not above its directory");
      expect(!rules.ignored("subway/x.tmp", false), "not in sibling with common prefix");
    }

    std::cout << "ignore test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
