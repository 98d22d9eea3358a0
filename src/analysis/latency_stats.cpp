#include "analysis/latency_stats.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <utility>

namespace hopmap::analysis {

namespace {

constexpr const char* kUnobservedHost = "???";

struct HopAccumulator {
  std::vector<double> samples;
  std::vector<std::string> addresses;
};

void AddUnique(std::vector<std::string>& values, const std::string& value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

std::map<std::uint32_t, HopAccumulator> CollectHops(const std::vector<probe::RunResult>& runs) {
  std::map<std::uint32_t, HopAccumulator> by_index;
  for (const auto& run : runs) {
    for (const auto& hop : run.hops) {
      HopAccumulator& accumulator = by_index[hop.index];
      accumulator.samples.insert(accumulator.samples.end(), hop.samples.begin(),
                                 hop.samples.end());
      for (const auto& address : hop.addresses) {
        AddUnique(accumulator.addresses, address);
      }
    }
  }
  return by_index;
}

std::string BarLabel(const std::vector<std::string>& addresses) {
  if (addresses.empty()) {
    return kUnobservedHost;
  }
  std::string label;
  for (const auto& address : addresses) {
    if (!label.empty()) {
      label += ", ";
    }
    label += address;
  }
  if (addresses.size() > 1U && label.size() > kMultipleEntriesLabel.size()) {
    return std::string(kMultipleEntriesLabel);
  }
  return label;
}

std::vector<double> CollectAllSamples(const std::vector<probe::RunResult>& runs) {
  std::vector<double> samples;
  for (const auto& run : runs) {
    for (const auto& hop : run.hops) {
      samples.insert(samples.end(), hop.samples.begin(), hop.samples.end());
    }
  }
  return samples;
}

} // namespace

AggregateStats ComputeAggregateStats(const std::vector<double>& samples_ms) {
  AggregateStats stats;
  if (samples_ms.empty()) {
    return stats;
  }

  stats.count = static_cast<std::uint64_t>(samples_ms.size());
  const auto [min_it, max_it] = std::minmax_element(samples_ms.begin(), samples_ms.end());
  stats.min_ms = *min_it;
  stats.max_ms = *max_it;

  const double sum = std::accumulate(samples_ms.begin(), samples_ms.end(), 0.0);
  const double mean = sum / static_cast<double>(samples_ms.size());
  stats.mean_ms = mean;

  if (samples_ms.size() >= 2U) {
    double squared_deviation = 0.0;
    for (const double sample : samples_ms) {
      squared_deviation += (sample - mean) * (sample - mean);
    }
    stats.stdev_ms = std::sqrt(squared_deviation / static_cast<double>(samples_ms.size() - 1U));
  }
  return stats;
}

TargetLatencyReport StatsFor(const store::RunStore& store, std::string_view target) {
  TargetLatencyReport report;
  report.target = std::string(target);
  report.entries = store.EntryCount(target);
  report.empty_entries = store.EmptyEntryCount(target);

  const auto& runs = store.History(target);
  const std::map<std::uint32_t, HopAccumulator> by_index = CollectHops(runs);
  std::map<std::string, std::set<std::string>> hostnames_by_address;
  for (const auto& run : runs) {
    report.max_hops = std::max<std::uint64_t>(report.max_hops, run.hops.size());
    for (const auto& hop : run.hops) {
      if (hop.addresses.size() == 1U && hop.hostname.has_value()) {
        hostnames_by_address[hop.addresses.front()].insert(hop.hostname.value());
      }
    }
  }

  report.per_hop.reserve(by_index.size());
  for (const auto& [index, accumulator] : by_index) {
    HopLatencyRow row;
    row.index = index;
    row.stats = ComputeAggregateStats(accumulator.samples);
    for (const auto& address : accumulator.addresses) {
      const auto named = hostnames_by_address.find(address);
      if (named != hostnames_by_address.end() && named->second.size() == 1U) {
        row.hosts.push_back(address + " (" + *named->second.begin() + ")");
      } else {
        row.hosts.push_back(address);
      }
    }
    if (row.hosts.empty()) {
      row.hosts.emplace_back(kUnobservedHost);
    }
    report.per_hop.push_back(std::move(row));
  }

  report.total = ComputeAggregateStats(CollectAllSamples(runs));
  return report;
}

std::vector<TargetSummaryRow> StatsForAll(const store::RunStore& store) {
  std::vector<TargetSummaryRow> rows;
  for (const auto& target : store.Targets()) {
    TargetSummaryRow row;
    row.target = target;
    row.entries = store.EntryCount(target);
    row.empty_entries = store.EmptyEntryCount(target);
    row.stats = ComputeAggregateStats(CollectAllSamples(store.History(target)));
    rows.push_back(std::move(row));
  }
  return rows;
}

StoreSummary SummarizeStore(const store::RunStore& store) {
  StoreSummary summary;
  const std::vector<std::string> targets = store.Targets();
  summary.target_count = targets.size();
  summary.entries = store.TotalEntryCount();
  summary.empty_entries = store.TotalEmptyEntryCount();

  std::vector<double> all_samples;
  std::uint64_t hop_total = 0;
  for (const auto& target : targets) {
    const auto& runs = store.History(target);
    std::uint64_t max_hops = 0;
    for (const auto& run : runs) {
      max_hops = std::max<std::uint64_t>(max_hops, run.hops.size());
    }
    hop_total += max_hops;
    const std::vector<double> samples = CollectAllSamples(runs);
    all_samples.insert(all_samples.end(), samples.begin(), samples.end());
  }

  if (!targets.empty()) {
    summary.average_hops_per_target =
        static_cast<double>(hop_total) / static_cast<double>(targets.size());
  }
  summary.total = ComputeAggregateStats(all_samples);
  return summary;
}

LatencyMatrix ComputeLatencyMatrix(const store::RunStore& store,
                                   const std::vector<std::string>& targets) {
  std::set<std::string> selected(targets.begin(), targets.end());
  if (selected.empty()) {
    const std::vector<std::string> all = store.Targets();
    selected.insert(all.begin(), all.end());
  }

  std::vector<std::pair<std::string, std::map<std::uint32_t, HopAccumulator>>> per_target;
  std::set<std::uint32_t> columns;
  for (const auto& target : selected) {
    auto hops = CollectHops(store.History(target));
    for (const auto& [index, accumulator] : hops) {
      columns.insert(index);
    }
    per_target.emplace_back(target, std::move(hops));
  }

  LatencyMatrix matrix;
  matrix.hop_indices.assign(columns.begin(), columns.end());
  for (const auto& [target, hops] : per_target) {
    LatencyMatrixRow row;
    row.target = target;
    row.cells.reserve(matrix.hop_indices.size());
    for (const std::uint32_t index : matrix.hop_indices) {
      LatencyMatrixCell cell;
      const auto found = hops.find(index);
      if (found != hops.end()) {
        const AggregateStats stats = ComputeAggregateStats(found->second.samples);
        cell.kind = stats.HasData() ? MatrixCellKind::kValue : MatrixCellKind::kNoData;
        cell.mean_ms = stats.mean_ms;
      }
      row.cells.push_back(cell);
    }
    matrix.rows.push_back(std::move(row));
  }
  return matrix;
}

LatencySeries ComputeLatencySeries(const store::RunStore& store, std::string_view target) {
  LatencySeries series;
  series.target = std::string(target);
  for (const auto& [index, accumulator] : CollectHops(store.History(target))) {
    LatencyBar bar;
    bar.index = index;
    bar.label = BarLabel(accumulator.addresses);
    bar.mean_ms = ComputeAggregateStats(accumulator.samples).mean_ms;
    series.bars.push_back(std::move(bar));
  }
  return series;
}

} // namespace hopmap::analysis
