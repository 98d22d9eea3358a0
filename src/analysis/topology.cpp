#include "analysis/topology.hpp"

#include <cstdint>

namespace hopmap::analysis {

namespace {

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

class TopologyBuilder {
public:
  void AddRun(const probe::RunResult& run) {
    const std::vector<probe::HopRecord>& hops = run.hops;
    if (hops.empty()) {
      return;
    }

    for (const auto& hop : hops) {
      if (hop.addresses.size() == 1U && hop.hostname.has_value()) {
        hostnames_by_address_[hop.addresses.front()].insert(hop.hostname.value());
      }
    }

    // Address sets as this run sees them, gaps filled with placeholders.
    std::vector<std::vector<std::string>> effective;
    effective.reserve(hops.size());
    for (const auto& hop : hops) {
      effective.push_back(hop.addresses);
    }
    if (effective.front().empty()) {
      effective.front().push_back(NewPlaceholder());
    }

    const std::string tag = TerminalTag(run.target);
    if (hops.size() == 1U) {
      for (const auto& address : effective.front()) {
        graph_.nodes.insert(Terminal(address, tag, run.target));
      }
      return;
    }

    std::map<std::string, std::string> placeholder_after;
    const std::size_t last = hops.size() - 1U;
    for (std::size_t i = 1; i <= last; ++i) {
      const std::vector<std::string>& predecessors = effective[i - 1U];
      if (effective[i].empty()) {
        effective[i].push_back(PlaceholderFor(predecessors, placeholder_after));
      }

      std::vector<std::string> currents;
      currents.reserve(effective[i].size());
      for (const auto& address : effective[i]) {
        currents.push_back(i == last ? Terminal(address, tag, run.target) : address);
      }

      for (const auto& previous : predecessors) {
        graph_.nodes.insert(previous);
        for (const auto& current : currents) {
          graph_.nodes.insert(current);
          graph_.edges.insert(TopologyEdge{previous, current});
        }
      }
    }
  }

  TopologyGraph Finish() {
    for (const auto& node : graph_.nodes) {
      const auto base_it = terminal_base_.find(node);
      const std::string& base = base_it == terminal_base_.end() ? node : base_it->second;
      const auto named = hostnames_by_address_.find(base);
      if (named != hostnames_by_address_.end() && named->second.size() == 1U) {
        graph_.labels[node] = *named->second.begin();
      }
    }
    return std::move(graph_);
  }

private:
  std::string NewPlaceholder() {
    return std::string(kPlaceholderPrefix) + std::to_string(++placeholder_count_);
  }

  // One placeholder per gap: reuse the one already tied to any predecessor in
  // this run, then tie it to every predecessor of the gap.
  std::string PlaceholderFor(const std::vector<std::string>& predecessors,
                             std::map<std::string, std::string>& placeholder_after) {
    std::string placeholder;
    for (const auto& previous : predecessors) {
      const auto it = placeholder_after.find(previous);
      if (it != placeholder_after.end()) {
        placeholder = it->second;
        break;
      }
    }
    if (placeholder.empty()) {
      placeholder = NewPlaceholder();
    }
    for (const auto& previous : predecessors) {
      placeholder_after.emplace(previous, placeholder);
    }
    return placeholder;
  }

  std::string Terminal(const std::string& address, const std::string& tag,
                       const std::string& target) {
    if (EndsWith(address, tag)) {
      graph_.terminals[address] = target;
      return address;
    }
    std::string id = address + tag;
    terminal_base_[id] = address;
    graph_.terminals[id] = target;
    return id;
  }

  TopologyGraph graph_;
  std::uint64_t placeholder_count_ = 0;
  std::map<std::string, std::set<std::string>> hostnames_by_address_;
  std::map<std::string, std::string> terminal_base_;
};

} // namespace

bool TopologyGraph::HasEdge(std::string_view from, std::string_view to) const {
  return edges.find(TopologyEdge{std::string(from), std::string(to)}) != edges.end();
}

bool IsPlaceholderNode(std::string_view node) {
  return node.substr(0, kPlaceholderPrefix.size()) == kPlaceholderPrefix;
}

std::string TerminalTag(std::string_view target) {
  return " <" + std::string(target) + ">";
}

TopologyGraph BuildTopology(const store::RunStore& store, const std::vector<std::string>& targets) {
  const std::set<std::string> ordered_targets(targets.begin(), targets.end());

  TopologyBuilder builder;
  for (const auto& target : ordered_targets) {
    for (const auto& run : store.History(target)) {
      builder.AddRun(run);
    }
  }
  return builder.Finish();
}

} // namespace hopmap::analysis
