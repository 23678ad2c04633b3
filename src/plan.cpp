#include "bumv/plan.hpp"

#include "bumv/consts.hpp"
#include "bumv/error.hpp"
#include "bumv/fs.hpp"
#include "bumv/hash.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <unistd.h>
#include <utility>

namespace {

// Picks "<dir>/<filename>.bumv-<hex>.tmp" names that collide with nothing known
class TempNamer {
public:
  TempNamer(std::set<std::string> taken, const bumv::OccupiedFn &occupied)
      : taken_(std::move(taken)), occupied_(occupied) {}

  std::string next(const bumv::PathEntry &source) {
    const std::filesystem::path src{source};
    for (int attempt = 0; attempt < bumv::consts::kMaxTempAttempts; ++attempt) {
      const std::string seed =
          std::to_string(::getpid()) + ":" + source + ":" + std::to_string(counter_++);
      const std::string hex =
          bumv::sha1_hex(seed).substr(0, bumv::consts::kTempHexLen);
      std::string name = src.filename().string();
      name.append(bumv::consts::kTempInfix);
      name.append(hex);
      name.append(bumv::consts::kTempSuffix);
      const std::string candidate = (src.parent_path() / name).generic_string();
      if (taken_.contains(candidate) || occupied_(candidate))
        continue;
      taken_.insert(candidate);
      return candidate;
    }
    throw bumv::Error(bumv::ErrorKind::Planning,
                      "cannot find a free temporary name to break the rename cycle at " + source,
                      {source});
  }

private:
  std::set<std::string> taken_;
  const bumv::OccupiedFn &occupied_;
  unsigned counter_ = 0;
};

} // namespace

namespace bumv {

Plan::Plan(RenameMapping mapping, std::vector<RenameGroup> groups)
    : mapping_(std::move(mapping)), groups_(std::move(groups)) {
  for (const auto &g : groups_) {
    const auto &steps = std::visit([](const auto &grp) -> const std::vector<Step> & {
      return grp.steps;
    }, g);
    steps_.insert(steps_.end(), steps.begin(), steps.end());
  }
}

std::size_t Plan::temporary_count() const {
  return static_cast<std::size_t>(std::ranges::count_if(
      groups_, [](const RenameGroup &g) { return std::holds_alternative<Cycle>(g); }));
}

std::string Plan::describe() const {
  std::string out;
  for (const auto &s : steps_) {
    if (!out.empty())
      out.push_back(consts::kLF);
    out.append(s.from).append(" -> ").append(s.to);
  }
  return out;
}

Plan build_plan(const RenameMapping &mapping, const Snapshot &snapshot,
                const OccupiedFn &occupied) {
  // Adjacency keyed by path. Sources are unique and targets are unique, so
  // every node has at most one successor and one predecessor.
  std::map<std::string, std::string> next;
  std::map<std::string, std::string> prev;
  for (const auto &r : mapping) {
    next[r.from] = r.to;
    prev[r.to] = r.from;
  }

  std::set<std::string> taken(snapshot.begin(), snapshot.end());
  for (const auto &r : mapping) {
    taken.insert(r.to);
    // directories a target needs cannot be temporary file names either
    for (auto pos = r.to.find('/'); pos != std::string::npos; pos = r.to.find('/', pos + 1))
      taken.insert(r.to.substr(0, pos));
  }
  TempNamer namer{std::move(taken), occupied};

  std::vector<RenameGroup> groups;
  std::set<std::string> planned; // sources already placed in a group

  // Visit components in line order of their first member
  for (const auto &r : mapping) {
    if (planned.contains(r.from))
      continue;

    // Walk predecessors to the chain start, or around the cycle back to r.from
    std::string head = r.from;
    bool cyclic = false;
    for (auto it = prev.find(head); it != prev.end(); it = prev.find(head)) {
      head = it->second;
      if (head == r.from) {
        cyclic = true;
        break;
      }
    }

    // Edges in mapping direction starting at head
    std::vector<Step> edges;
    std::string cur = head;
    for (auto it = next.find(cur); it != next.end(); it = next.find(cur)) {
      edges.push_back(Step{.from = cur, .to = it->second});
      planned.insert(cur);
      cur = it->second;
      if (cyclic && cur == head)
        break;
    }

    if (!cyclic) {
      Chain chain;
      chain.steps.assign(edges.rbegin(), edges.rend());
      groups.emplace_back(std::move(chain));
      continue;
    }

    // edges = A->B, B->C, ..., X->A
    Cycle cycle;
    cycle.temp = namer.next(head);
    cycle.steps.push_back(Step{.from = head, .to = cycle.temp, .temporary = true});
    for (auto it = edges.rbegin(); it != std::prev(edges.rend()); ++it)
      cycle.steps.push_back(*it);
    cycle.steps.push_back(Step{.from = cycle.temp, .to = edges.front().to, .temporary = true});
    groups.emplace_back(std::move(cycle));
  }

  return Plan{mapping, std::move(groups)};
}

Plan build_plan(const RenameMapping &mapping, const Snapshot &snapshot,
                const std::filesystem::path &root) {
  return build_plan(mapping, snapshot,
                    [&root](const PathEntry &p) { return fs::occupied(root / p); });
}

} // namespace bumv
