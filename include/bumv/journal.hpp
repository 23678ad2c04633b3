#pragma once
#include "bumv/plan.hpp"

#include <cstddef>
#include <vector>

namespace bumv {

// Append-only record of completed renames. The executor never rolls back;
// a journal is the hook for anything that wants to (an undo command, a log).
class Journal {
public:
  virtual ~Journal() = default;
  // Called once per step, right after its rename succeeded
  virtual void append(std::size_t index, const Step& step) = 0;
};

class MemoryJournal : public Journal {
public:
  void append(std::size_t /*index*/, const Step& step) override { entries_.push_back(step); }

  [[nodiscard]] const std::vector<Step>& entries() const { return entries_; }

private:
  std::vector<Step> entries_;
};

} // namespace bumv
