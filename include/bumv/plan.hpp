#pragma once
#include "bumv/path_entry.hpp"
#include "bumv/snapshot.hpp"
#include "bumv/validate.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace bumv {

// One rename(2) call, root-relative
struct Step {
  PathEntry from;
  PathEntry to;
  bool temporary = false; // `from` or `to` is a cycle-breaking temporary name

  bool operator==(const Step&) const = default;
};

// Open sequence a->b->c; steps are ordered tail first (b->c, then a->b)
struct Chain {
  std::vector<Step> steps;
};

// a->b->...->a; broken by a->tmp first and tmp->b last
struct Cycle {
  PathEntry temp;
  std::vector<Step> steps;
};

using RenameGroup = std::variant<Chain, Cycle>;

class Plan {
public:
  Plan() = default;
  Plan(RenameMapping mapping, std::vector<RenameGroup> groups);

  [[nodiscard]] const RenameMapping& mapping() const { return mapping_; }
  [[nodiscard]] const std::vector<RenameGroup>& groups() const { return groups_; }
  // All steps of all groups, in execution order
  [[nodiscard]] const std::vector<Step>& steps() const { return steps_; }
  [[nodiscard]] bool empty() const { return steps_.empty(); }
  [[nodiscard]] auto temporary_count() const -> std::size_t;

  // "old -> new" per step, newline separated
  [[nodiscard]] auto describe() const -> std::string;

private:
  RenameMapping mapping_;
  std::vector<RenameGroup> groups_;
  std::vector<Step> steps_;
};

// Does a root-relative path already exist? Consulted when choosing temporary names.
using OccupiedFn = std::function<bool(const PathEntry&)>;

/**
 * Decompose a validated mapping into chains and cycles and order the steps so
 * that every rename's target is free and its source present when it runs.
 * Each cycle gets exactly one temporary name, unique against the snapshot,
 * every target and `occupied`.
 * Throws bumv::Error{ErrorKind::Planning} if no temporary name can be found.
 */
auto build_plan(const RenameMapping& mapping, const Snapshot& snapshot,
                const OccupiedFn& occupied) -> Plan;

// Same, checking temporary names against the filesystem below `root`
auto build_plan(const RenameMapping& mapping, const Snapshot& snapshot,
                const std::filesystem::path& root) -> Plan;

} // namespace bumv
