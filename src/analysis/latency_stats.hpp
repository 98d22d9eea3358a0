#pragma once

#include "store/run_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hopmap::analysis {

// Summary of a latency sample set, in milliseconds.
//
// `count == 0` means "no data": every other field is empty. `stdev_ms` is the
// sample standard deviation (divisor n-1) and stays empty below two samples,
// so a true zero spread is never confused with "not computable".
struct AggregateStats {
  std::uint64_t count = 0;
  std::optional<double> mean_ms;
  std::optional<double> min_ms;
  std::optional<double> max_ms;
  std::optional<double> stdev_ms;

  bool HasData() const {
    return count > 0U;
  }
};

AggregateStats ComputeAggregateStats(const std::vector<double>& samples_ms);

// Latency at one hop index, merged over every run of a target.
//
// `hosts` lists the addresses seen at this index across runs, rendered as
// `address (hostname)` when the address has one unambiguous hostname. A lone
// `???` means no run observed an address here.
struct HopLatencyRow {
  std::uint32_t index = 0;
  std::vector<std::string> hosts;
  AggregateStats stats;
};

struct TargetLatencyReport {
  std::string target;
  std::uint64_t entries = 0;
  std::uint64_t empty_entries = 0;
  std::uint64_t max_hops = 0;
  std::vector<HopLatencyRow> per_hop;
  AggregateStats total;
};

// One row per target over every sample of every hop of every run.
struct TargetSummaryRow {
  std::string target;
  std::uint64_t entries = 0;
  std::uint64_t empty_entries = 0;
  AggregateStats stats;
};

struct StoreSummary {
  std::uint64_t target_count = 0;
  std::uint64_t entries = 0;
  std::uint64_t empty_entries = 0;
  std::optional<double> average_hops_per_target;
  AggregateStats total;
};

// Per-hop and overall latency for one target. Runs without hops contribute
// nothing; an unknown target yields an empty report with `total.count == 0`.
TargetLatencyReport StatsFor(const store::RunStore& store, std::string_view target);

// One summary row per target, targets in lexicographic order.
std::vector<TargetSummaryRow> StatsForAll(const store::RunStore& store);

// Store-wide counts and latency over every recorded sample.
StoreSummary SummarizeStore(const store::RunStore& store);

// Chart data.

enum class MatrixCellKind {
  // Mean latency of every sample at this hop index.
  kValue,
  // The target reached this hop index but every probe there timed out.
  kNoData,
  // The target never reached this hop index (row padding).
  kMissingHop,
};

struct LatencyMatrixCell {
  MatrixCellKind kind = MatrixCellKind::kMissingHop;
  std::optional<double> mean_ms;
};

struct LatencyMatrixRow {
  std::string target;
  std::vector<LatencyMatrixCell> cells;
};

// Targets x hop indices. `hop_indices` is the sorted union of hop indices
// observed for the selected targets; every row has one cell per column.
struct LatencyMatrix {
  std::vector<std::uint32_t> hop_indices;
  std::vector<LatencyMatrixRow> rows;
};

// Average latency per (target, hop index). An empty `targets` selects every
// target in the store. Rows follow lexicographic target order.
LatencyMatrix ComputeLatencyMatrix(const store::RunStore& store,
                                   const std::vector<std::string>& targets);

inline constexpr std::string_view kMultipleEntriesLabel = "Multiple Entries";

// One bar per hop index of a target.
//
// `label` joins the addresses seen at that index with `, ` (no hostnames).
// A joined label longer than "Multiple Entries" that names more than one
// address collapses to that text. `???` marks an index with no address.
struct LatencyBar {
  std::uint32_t index = 0;
  std::string label;
  std::optional<double> mean_ms;
};

struct LatencySeries {
  std::string target;
  std::vector<LatencyBar> bars;
};

LatencySeries ComputeLatencySeries(const store::RunStore& store, std::string_view target);

} // namespace hopmap::analysis
