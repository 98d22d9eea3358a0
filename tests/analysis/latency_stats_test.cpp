#include "analysis/latency_stats.hpp"

#include "common/run_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace common = hopmap::tests::common;
using Catch::Matchers::WithinAbs;

TEST_CASE("Aggregate stats use the sample standard deviation", "[analysis][stats]") {
  const auto stats = hopmap::analysis::ComputeAggregateStats({1.0, 2.0, 3.0, 4.0});
  REQUIRE(stats.count == 4U);
  REQUIRE(stats.mean_ms.value() == 2.5);
  REQUIRE(stats.min_ms.value() == 1.0);
  REQUIRE(stats.max_ms.value() == 4.0);
  // sqrt(5 / 3): divisor n-1, not n.
  REQUIRE_THAT(stats.stdev_ms.value(), WithinAbs(1.2909944487, 1e-9));
}

TEST_CASE("Stdev is absent below two samples", "[analysis][stats]") {
  const auto single = hopmap::analysis::ComputeAggregateStats({7.5});
  REQUIRE(single.count == 1U);
  REQUIRE(single.mean_ms.value() == 7.5);
  REQUIRE_FALSE(single.stdev_ms.has_value());

  const auto flat = hopmap::analysis::ComputeAggregateStats({3.0, 3.0});
  REQUIRE(flat.stdev_ms.has_value());
  REQUIRE(flat.stdev_ms.value() == 0.0);
}

TEST_CASE("Empty sample set has no statistics", "[analysis][stats]") {
  const auto stats = hopmap::analysis::ComputeAggregateStats({});
  REQUIRE_FALSE(stats.HasData());
  REQUIRE_FALSE(stats.mean_ms.has_value());
  REQUIRE_FALSE(stats.min_ms.has_value());
  REQUIRE_FALSE(stats.max_ms.has_value());
  REQUIRE_FALSE(stats.stdev_ms.has_value());
}

TEST_CASE("A target with only a no-data run reports no samples anywhere", "[analysis][stats]") {
  const hopmap::store::RunStore store = common::MakeStore({common::MakeRun("example.com", {})});

  const auto report = hopmap::analysis::StatsFor(store, "example.com");
  REQUIRE(report.entries == 0U);
  REQUIRE(report.empty_entries == 1U);
  REQUIRE(report.per_hop.empty());
  REQUIRE(report.total.count == 0U);

  const auto rows = hopmap::analysis::StatsForAll(store);
  REQUIRE(rows.size() == 1U);
  REQUIRE(rows.front().stats.count == 0U);

  const auto summary = hopmap::analysis::SummarizeStore(store);
  REQUIRE(summary.total.count == 0U);
  REQUIRE(summary.average_hops_per_target.value() == 0.0);
}

TEST_CASE("Per-hop stats merge samples at the same index across runs", "[analysis][stats]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("example.com",
                      {
                          common::MakeHop(1, {"192.168.1.1"}, {1.0, 2.0, 3.0}, 0, "gateway"),
                          common::MakeHop(2, {}, {}, 3),
                          common::MakeHop(3, {"93.184.216.34"}, {10.0, 12.0}, 1),
                      }),
      common::MakeRun("example.com",
                      {
                          common::MakeHop(1, {"192.168.1.1"}, {5.0, 5.0, 5.0}, 0, "gateway"),
                          common::MakeHop(2, {"198.51.100.7"}, {8.0}, 2),
                      }),
      common::MakeRun("example.com", {}),
  });

  const auto report = hopmap::analysis::StatsFor(store, "example.com");
  REQUIRE(report.entries == 2U);
  REQUIRE(report.empty_entries == 1U);
  REQUIRE(report.max_hops == 3U);
  REQUIRE(report.per_hop.size() == 3U);

  REQUIRE(report.per_hop[0].index == 1U);
  REQUIRE(report.per_hop[0].hosts == std::vector<std::string>{"192.168.1.1 (gateway)"});
  REQUIRE(report.per_hop[0].stats.count == 6U);
  REQUIRE(report.per_hop[0].stats.mean_ms.value() == 3.5);

  REQUIRE(report.per_hop[1].hosts == std::vector<std::string>{"198.51.100.7"});
  REQUIRE(report.per_hop[1].stats.count == 1U);
  REQUIRE_FALSE(report.per_hop[1].stats.stdev_ms.has_value());

  REQUIRE(report.per_hop[2].stats.count == 2U);
  REQUIRE(report.total.count == 9U);
  REQUIRE(report.total.min_ms.value() == 1.0);
  REQUIRE(report.total.max_ms.value() == 12.0);
}

TEST_CASE("Hop that never answered renders as unobserved", "[analysis][stats]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("example.com", {common::MakeHop(1, {}, {}, 3),
                                      common::MakeHop(2, {"10.0.0.2"}, {1.0, 1.0, 1.0})}),
  });

  const auto report = hopmap::analysis::StatsFor(store, "example.com");
  REQUIRE(report.per_hop.size() == 2U);
  REQUIRE(report.per_hop[0].hosts == std::vector<std::string>{"???"});
  REQUIRE(report.per_hop[0].stats.count == 0U);
}

TEST_CASE("Conflicting hostnames leave the address bare", "[analysis][stats]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("example.com", {common::MakeHop(1, {"203.0.113.1"}, {1.0, 1.0, 1.0}, 0,
                                                      "a.example")}),
      common::MakeRun("example.com", {common::MakeHop(1, {"203.0.113.1"}, {1.0, 1.0, 1.0}, 0,
                                                      "b.example")}),
  });

  const auto report = hopmap::analysis::StatsFor(store, "example.com");
  REQUIRE(report.per_hop.front().hosts == std::vector<std::string>{"203.0.113.1"});
}

TEST_CASE("Store summary spans every target", "[analysis][stats]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("a.example", {common::MakeHop(1, {"10.0.0.1"}, {2.0, 2.0, 2.0}),
                                    common::MakeHop(2, {"10.0.0.2"}, {4.0, 4.0, 4.0})}),
      common::MakeRun("b.example", {common::MakeHop(1, {"10.0.1.1"}, {6.0, 6.0, 6.0})}),
      common::MakeRun("b.example", {}),
  });

  const auto summary = hopmap::analysis::SummarizeStore(store);
  REQUIRE(summary.target_count == 2U);
  REQUIRE(summary.entries == 2U);
  REQUIRE(summary.empty_entries == 1U);
  REQUIRE(summary.average_hops_per_target.value() == 1.5);
  REQUIRE(summary.total.count == 9U);
  REQUIRE(summary.total.mean_ms.value() == 4.0);

  const auto rows = hopmap::analysis::StatsForAll(store);
  REQUIRE(rows.size() == 2U);
  REQUIRE(rows[0].target == "a.example");
  REQUIRE(rows[0].stats.mean_ms.value() == 3.0);
  REQUIRE(rows[1].target == "b.example");
  REQUIRE(rows[1].empty_entries == 1U);
}

TEST_CASE("Unknown target yields an empty report", "[analysis][stats]") {
  const hopmap::store::RunStore store{};
  const auto report = hopmap::analysis::StatsFor(store, "nowhere.example");
  REQUIRE(report.per_hop.empty());
  REQUIRE_FALSE(report.total.HasData());

  const auto summary = hopmap::analysis::SummarizeStore(store);
  REQUIRE_FALSE(summary.average_hops_per_target.has_value());
}

TEST_CASE("Latency matrix separates timed-out hops from hops never reached", "[analysis][chart]") {
  using hopmap::analysis::MatrixCellKind;
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("a.example", {common::MakeHop(1, {"192.168.1.1"}, {1.0, 3.0}),
                                    common::MakeHop(2, {}, {}, 3),
                                    common::MakeHop(3, {"203.0.113.7"}, {10.0})}),
      common::MakeRun("b.example", {common::MakeHop(1, {"192.168.1.1"}, {5.0})}),
      common::MakeRun("c.example", {}),
  });

  const auto matrix = hopmap::analysis::ComputeLatencyMatrix(store, {});
  REQUIRE(matrix.hop_indices == std::vector<std::uint32_t>{1, 2, 3});
  REQUIRE(matrix.rows.size() == 3U);

  const auto& a = matrix.rows[0];
  REQUIRE(a.target == "a.example");
  REQUIRE(a.cells.size() == 3U);
  REQUIRE(a.cells[0].kind == MatrixCellKind::kValue);
  REQUIRE(a.cells[0].mean_ms.value() == 2.0);
  REQUIRE(a.cells[1].kind == MatrixCellKind::kNoData);
  REQUIRE_FALSE(a.cells[1].mean_ms.has_value());
  REQUIRE(a.cells[2].kind == MatrixCellKind::kValue);
  REQUIRE(a.cells[2].mean_ms.value() == 10.0);

  const auto& b = matrix.rows[1];
  REQUIRE(b.target == "b.example");
  REQUIRE(b.cells[0].mean_ms.value() == 5.0);
  REQUIRE(b.cells[1].kind == MatrixCellKind::kMissingHop);
  REQUIRE(b.cells[2].kind == MatrixCellKind::kMissingHop);

  const auto& c = matrix.rows[2];
  REQUIRE(c.target == "c.example");
  REQUIRE(c.cells.size() == 3U);
  for (const auto& cell : c.cells) {
    REQUIRE(cell.kind == MatrixCellKind::kMissingHop);
  }

  const auto only_b = hopmap::analysis::ComputeLatencyMatrix(store, {"b.example"});
  REQUIRE(only_b.hop_indices == std::vector<std::uint32_t>{1});
  REQUIRE(only_b.rows.size() == 1U);
  REQUIRE(only_b.rows.front().cells.front().kind == MatrixCellKind::kValue);
}

TEST_CASE("Latency series labels collapse long multi-address hops", "[analysis][chart]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("example.com",
                      {common::MakeHop(1, {"192.168.1.1"}, {1.0}, 0, "gateway"),
                       common::MakeHop(2, {"10.0.0.1", "10.0.0.2"}, {2.0, 4.0}),
                       common::MakeHop(3, {"1.1.1.1"}, {3.0}),
                       common::MakeHop(4, {}, {}, 3)}),
      common::MakeRun("example.com", {common::MakeHop(3, {"2.2.2.2"}, {5.0})}),
  });

  const auto series = hopmap::analysis::ComputeLatencySeries(store, "example.com");
  REQUIRE(series.target == "example.com");
  REQUIRE(series.bars.size() == 4U);

  // Addresses only; hostnames stay in the table view.
  REQUIRE(series.bars[0].label == "192.168.1.1");
  REQUIRE(series.bars[0].mean_ms.value() == 1.0);
  REQUIRE(series.bars[1].label == "Multiple Entries");
  REQUIRE(series.bars[1].mean_ms.value() == 3.0);
  // Sixteen characters: short enough to show both addresses.
  REQUIRE(series.bars[2].label == "1.1.1.1, 2.2.2.2");
  REQUIRE(series.bars[2].mean_ms.value() == 4.0);
  REQUIRE(series.bars[3].label == "???");
  REQUIRE_FALSE(series.bars[3].mean_ms.has_value());

  REQUIRE(hopmap::analysis::ComputeLatencySeries(store, "unknown.example").bars.empty());
}
