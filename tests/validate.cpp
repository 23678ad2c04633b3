#include "bumv/error.hpp"
#include "bumv/listfile.hpp"
#include "bumv/validate.hpp"

#include "scratch.hpp"

#include <iostream>
#include <string>
#include <vector>

using bumv::ErrorKind;
using testutil::expect;

namespace {

const bumv::ValidateOptions kFlat{.recursive = false};
const bumv::ValidateOptions kRecursive{.recursive = true};

template <typename F>
bumv::Error expect_error(F &&f, ErrorKind kind, const std::string &what) {
  try {
    f();
  } catch (const bumv::Error &e) {
    if (e.kind() != kind)
      throw std::runtime_error(what + ": wrong error kind: " + e.what());
    return e;
  }
  throw std::runtime_error(what + ": expected a rejection");
}

} // namespace

int main() {
  try {
    const bumv::Snapshot snap{"a.txt", "b.txt", "c.txt"};

    // Unedited list: nothing to do
    {
      auto m = bumv::validate(snap, snap, kFlat);
      expect(m.empty(), "unedited list gives empty mapping");
    }

    // Unedited list file: nothing to do, even for names of spaces
    {
      const bumv::Snapshot spaced{"a b ", "x", "  "};
      auto m = bumv::validate(spaced, bumv::parse_list(bumv::render_list(spaced)), kFlat);
      expect(m.empty(), "unedited list file gives empty mapping");
    }

    // Lines added or removed
    expect_error([&] { (void)bumv::validate(snap, {"a.txt", "b.txt"}, kFlat); },
                 ErrorKind::Structural, "removed line");
    expect_error(
        [&] { (void)bumv::validate(snap, {"a.txt", "b.txt", "c.txt", "d.txt"}, kFlat); },
        ErrorKind::Structural, "added line");

    // Two changed lines with the same target; both lines are reported
    {
      auto e = expect_error(
          [&] { (void)bumv::validate(snap, {"x.txt", "x.txt", "c.txt"}, kFlat); },
          ErrorKind::Structural, "duplicate target");
      expect(e.details().size() == 2, "duplicate target lists both lines");
      expect(e.details()[0].starts_with("line 1:"), "first offending line is line 1");
    }

    // Target is a file that stays where it is
    {
      auto e = expect_error(
          [&] { (void)bumv::validate(snap, {"c.txt", "b.txt", "c.txt"}, kFlat); },
          ErrorKind::Structural, "overwrite untouched");
      expect(e.details().size() == 1, "one line overwrites an untouched file");
    }

    // Target is a file that is itself renamed away: chain, in both line orders
    {
      auto m = bumv::validate(snap, {"b.txt", "d.txt", "c.txt"}, kFlat);
      expect(m.size() == 2, "chain a->b, b->d accepted");
      auto m2 = bumv::validate(snap, {"d.txt", "a.txt", "c.txt"}, kFlat);
      expect(m2.size() == 2, "chain b->a, a->d accepted");
      expect(m2[0].line == 1 && m2[0].from == "a.txt" && m2[0].to == "d.txt",
             "mapping keeps line order");
    }

    // Swap and rotation
    {
      auto m = bumv::validate(snap, {"b.txt", "a.txt", "c.txt"}, kFlat);
      expect(m.size() == 2, "swap accepted");
      auto r = bumv::validate(snap, {"b.txt", "c.txt", "a.txt"}, kFlat);
      expect(r.size() == 3, "rotation accepted");
    }

    // Malformed paths
    expect_error([&] { (void)bumv::validate(snap, {"", "b.txt", "c.txt"}, kFlat); },
                 ErrorKind::Structural, "empty line");
    expect_error(
        [&] {
          (void)bumv::validate(snap, {bumv::normalize_entry("../a.txt"), "b.txt", "c.txt"},
                               kFlat);
        },
        ErrorKind::Structural, "escape via ..");
    expect_error(
        [&] {
          (void)bumv::validate(snap, {bumv::normalize_entry("sub/../../a.txt"), "b.txt", "c.txt"},
                               kRecursive);
        },
        ErrorKind::Structural, "escape via nested ..");
    expect_error([&] { (void)bumv::validate(snap, {"/etc/a.txt", "b.txt", "c.txt"}, kRecursive); },
                 ErrorKind::Structural, "absolute path");
    expect_error([&] { (void)bumv::validate(snap, {"a/", "b.txt", "c.txt"}, kRecursive); },
                 ErrorKind::Structural, "directory target");
    expect_error([&] { (void)bumv::validate(snap, {"a\rb", "b.txt", "c.txt"}, kFlat); },
                 ErrorKind::Structural, "carriage return in target");

    // Subdirectories need --recursive
    expect_error([&] { (void)bumv::validate(snap, {"sub/a.txt", "b.txt", "c.txt"}, kFlat); },
                 ErrorKind::Structural, "subdir in flat mode");
    {
      auto m = bumv::validate(snap, {"sub/a.txt", "b.txt", "c.txt"}, kRecursive);
      expect(m.size() == 1 && m[0].to == "sub/a.txt", "subdir in recursive mode");
    }

    // A name cannot be both a file and a directory afterwards
    expect_error([&] { (void)bumv::validate(snap, {"d", "d/e", "c.txt"}, kRecursive); },
                 ErrorKind::Structural, "file/directory clash");
    expect_error([&] { (void)bumv::validate(snap, {"c.txt/x", "b.txt", "c.txt"}, kRecursive); },
                 ErrorKind::Structural, "target below an existing file");
    // ...nor while the run is in progress: a file that is renamed away still
    // occupies its name until its own step, in either line order
    {
      const bumv::Snapshot sd{"a", "d", "y"};
      auto e = expect_error([&] { (void)bumv::validate(sd, {"d/e", "z", "y"}, kRecursive); },
                            ErrorKind::Structural, "target below a file renamed later");
      expect(e.details().size() == 1 && e.details()[0].starts_with("line 1:"),
             "the line moving into d is reported");
      expect_error([&] { (void)bumv::validate(sd, {"z", "d/e", "y"}, kRecursive); },
                   ErrorKind::Structural, "target below a file renamed earlier");
      expect_error([&] { (void)bumv::validate(sd, {"a/e", "d", "y"}, kRecursive); },
                   ErrorKind::Structural, "file moved below its own name");
    }
    {
      const bumv::Snapshot sd{"d/e", "y"};
      auto e = expect_error([&] { (void)bumv::validate(sd, {"x", "d"}, kRecursive); },
                            ErrorKind::Structural, "target is a directory being emptied");
      expect(e.details().size() == 1 && e.details()[0].starts_with("line 2:"),
             "the line naming the directory is reported");
      const bumv::Snapshot sd2{"y", "z/d/e"};
      expect_error([&] { (void)bumv::validate(sd2, {"z/d", "x"}, kRecursive); },
                   ErrorKind::Structural, "directory emptied by a later line");
    }
    {
      // "d.txt" and "d/e" do not clash even though "d.txt" sorts between them
      auto m = bumv::validate(snap, {"d.txt", "d/e", "c.txt"}, kRecursive);
      expect(m.size() == 2, "similar prefixes are not directories");
    }

    // Equivalent spellings are equal after normalization
    {
      const auto edited = bumv::parse_list("./a.txt\nb.txt\nx//../c.txt\n");
      auto m = bumv::validate(snap, edited, kRecursive);
      expect(m.empty(), "normalized spellings are no-ops: " + testutil::join(edited));
    }

    std::cout << "validate test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
