#include "bumv/validate.hpp"

#include "bumv/error.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace {

std::string describe_line(std::size_t line, const std::string &from, const std::string &to) {
  return "line " + std::to_string(line) + ": " + from + " -> " + (to.empty() ? "<empty>" : to);
}

} // namespace

namespace bumv {

RenameMapping validate(const Snapshot &snapshot, const std::vector<PathEntry> &edited,
                       const ValidateOptions &options) {
  // 1) structural: lines added or removed
  if (edited.size() != snapshot.size()) {
    throw Error(ErrorKind::Structural,
                "the edited list has " + std::to_string(edited.size()) + " lines but " +
                    std::to_string(snapshot.size()) +
                    " files were listed; lines must not be added or removed");
  }

  RenameMapping mapping;
  std::set<std::string> sources;
  for (std::size_t i = 0; i < snapshot.size(); ++i) {
    if (snapshot[i] != edited[i]) {
      mapping.push_back(Rename{.line = i + 1, .from = snapshot[i], .to = edited[i]});
      sources.insert(snapshot[i]);
    }
  }

  // 2) two changed lines with the same new name
  {
    std::map<std::string, std::vector<const Rename *>> by_target;
    for (const auto &r : mapping)
      if (!r.to.empty())
        by_target[r.to].push_back(&r);
    std::vector<std::string> details;
    for (const auto &[target, renames] : by_target) {
      if (renames.size() < 2)
        continue;
      for (const auto *r : renames)
        details.push_back(describe_line(r->line, r->from, r->to));
    }
    if (!details.empty())
      throw Error(ErrorKind::Structural, "several files would be renamed to the same name",
                  std::move(details));
  }

  // 3) a target that is an untouched file
  {
    const std::set<std::string> listed(snapshot.begin(), snapshot.end());
    std::vector<std::string> details;
    for (const auto &r : mapping) {
      if (listed.contains(r.to) && !sources.contains(r.to))
        details.push_back(describe_line(r.line, r.from, r.to) + " (overwrites an unchanged file)");
    }
    if (!details.empty())
      throw Error(ErrorKind::Structural, "a rename would overwrite a file that is not renamed",
                  std::move(details));
  }

  // 4) well-formedness, and file/directory clashes. A name that is a file
  // before or after the run cannot be a directory at any point of it.
  {
    std::vector<std::string> details;
    for (const auto &r : mapping) {
      if (auto why = malformed_reason(r.to, options.recursive))
        details.push_back(describe_line(r.line, r.from, r.to) + " (" + *why + ")");
    }
    if (details.empty() && !mapping.empty()) {
      const std::set<std::string> final_names(edited.begin(), edited.end());
      std::set<std::string> names(snapshot.begin(), snapshot.end());
      names.insert(final_names.begin(), final_names.end());
      for (const auto &r : mapping) {
        const auto it = names.lower_bound(r.to + "/");
        if (it != names.end() && is_ancestor(r.to, *it)) {
          details.push_back(describe_line(r.line, r.from, r.to) + " (is a directory of " + *it +
                            ")");
          continue;
        }
        for (auto pos = r.to.find('/'); pos != std::string::npos; pos = r.to.find('/', pos + 1)) {
          const std::string dir = r.to.substr(0, pos);
          if (final_names.contains(dir)) {
            details.push_back(describe_line(r.line, r.from, r.to) + " (" + dir + " is a file)");
            break;
          }
          if (names.contains(dir)) {
            details.push_back(describe_line(r.line, r.from, r.to) + " (" + dir +
                              " is a file until it is renamed)");
            break;
          }
        }
      }
    }
    if (!details.empty())
      throw Error(ErrorKind::Structural, "the edited list contains invalid paths",
                  std::move(details));
  }

  return mapping;
}

} // namespace bumv
