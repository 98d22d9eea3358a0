#pragma once

#include "store/run_store.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hopmap::analysis {

struct TopologyEdge {
  std::string from;
  std::string to;

  auto operator<=>(const TopologyEdge& other) const = default;
};

// Directed graph of observed hop addresses merged over many runs.
//
// Node ids are one of:
// - a real address, e.g. `192.0.2.1`
// - a placeholder for a hop whose address was not observed, `???#<n>`
// - a terminal id, the last hop of a run suffixed with ` <target>`
//
// `labels` holds a hostname for nodes whose address resolved to exactly one
// hostname over the whole merge. `terminals` maps terminal ids to their target.
struct TopologyGraph {
  std::set<std::string> nodes;
  std::set<TopologyEdge> edges;
  std::map<std::string, std::string> labels;
  std::map<std::string, std::string> terminals;

  bool HasEdge(std::string_view from, std::string_view to) const;
};

inline constexpr std::string_view kPlaceholderPrefix = "???#";

bool IsPlaceholderNode(std::string_view node);

// ` <target>`, the suffix that marks a terminal node.
std::string TerminalTag(std::string_view target);

// Merges every run with data of every listed target (duplicates ignored).
//
// Targets are walked in lexicographic order and runs in store order, so
// placeholder numbering is reproducible. A missing hop becomes one placeholder
// per gap and run; placeholders are never shared between runs.
TopologyGraph BuildTopology(const store::RunStore& store, const std::vector<std::string>& targets);

} // namespace hopmap::analysis
