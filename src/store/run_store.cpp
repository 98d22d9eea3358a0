#include "store/run_store.hpp"

#include <algorithm>

namespace hopmap::store {

void RunStore::Append(probe::RunResult run) {
  const std::string target = run.target;
  runs_by_target_[target].push_back(std::move(run));
}

const std::vector<probe::RunResult>& RunStore::History(std::string_view target) const {
  static const std::vector<probe::RunResult> kNoRuns;
  const auto it = runs_by_target_.find(target);
  if (it == runs_by_target_.end()) {
    return kNoRuns;
  }
  return it->second;
}

std::vector<std::string> RunStore::Targets() const {
  std::vector<std::string> targets;
  targets.reserve(runs_by_target_.size());
  for (const auto& [target, runs] : runs_by_target_) {
    targets.push_back(target);
  }
  return targets;
}

bool RunStore::Contains(std::string_view target) const {
  return runs_by_target_.find(target) != runs_by_target_.end();
}

std::size_t RunStore::EntryCount(std::string_view target) const {
  const auto& runs = History(target);
  return static_cast<std::size_t>(std::count_if(
      runs.begin(), runs.end(), [](const probe::RunResult& run) { return run.HasData(); }));
}

std::size_t RunStore::EmptyEntryCount(std::string_view target) const {
  return History(target).size() - EntryCount(target);
}

std::size_t RunStore::TotalEntryCount() const {
  std::size_t total = 0;
  for (const auto& [target, runs] : runs_by_target_) {
    total += EntryCount(target);
  }
  return total;
}

std::size_t RunStore::TotalEmptyEntryCount() const {
  std::size_t total = 0;
  for (const auto& [target, runs] : runs_by_target_) {
    total += EmptyEntryCount(target);
  }
  return total;
}

} // namespace hopmap::store
