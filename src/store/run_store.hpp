#pragma once

#include "probe/run_result.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hopmap::store {

// Append-only history of completed runs, grouped by target.
//
// Per target, insertion order is chronological order. Stored runs are never
// edited or removed; Append() is the only mutating operation.
class RunStore {
public:
  void Append(probe::RunResult run);

  // Runs for `target` in append order; empty for unknown targets.
  const std::vector<probe::RunResult>& History(std::string_view target) const;

  // All targets in lexicographic order.
  std::vector<std::string> Targets() const;

  bool Contains(std::string_view target) const;

  // Runs with hop data / "no data" runs for one target.
  std::size_t EntryCount(std::string_view target) const;
  std::size_t EmptyEntryCount(std::string_view target) const;

  std::size_t TotalEntryCount() const;
  std::size_t TotalEmptyEntryCount() const;

  bool Empty() const {
    return runs_by_target_.empty();
  }

private:
  std::map<std::string, std::vector<probe::RunResult>, std::less<>> runs_by_target_;
};

} // namespace hopmap::store
