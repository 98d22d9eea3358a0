#pragma once

#include "analysis/latency_stats.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hopmap::artifacts {

// Emits `<output_dir>/stats-<target>.csv`: one row per hop index plus a
// closing `total` row.
//
// Columns: hop,hosts,count,mean_ms,min_ms,max_ms,stdev_ms. Hosts are joined
// with `; `. Undefined statistics are written as `-` so they never read as
// zero latency.
bool WriteTargetStatsCsv(const analysis::TargetLatencyReport& report,
                         const std::filesystem::path& output_dir,
                         std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/stats-<target>.json`; undefined statistics are `null`.
bool WriteTargetStatsJson(const analysis::TargetLatencyReport& report,
                          const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/summary.csv` with one row per target.
bool WriteSummaryCsv(const std::vector<analysis::TargetSummaryRow>& rows,
                     const std::filesystem::path& output_dir,
                     std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/summary.json` with store-wide figures and per-target
// rows.
bool WriteSummaryJson(const analysis::StoreSummary& summary,
                      const std::vector<analysis::TargetSummaryRow>& rows,
                      const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/chart.csv`: `target` followed by one column per hop
// index. Cells hold the mean latency, `no_data` when every probe at that hop
// timed out, or `missing` when the target never reached that hop.
bool WriteLatencyMatrixCsv(const analysis::LatencyMatrix& matrix,
                           const std::filesystem::path& output_dir,
                           std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/chart.json` with `hops` and per-target `cells`, using
// the same `no_data` / `missing` markers as the CSV.
bool WriteLatencyMatrixJson(const analysis::LatencyMatrix& matrix,
                            const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/chart-<target>.csv` (hop,label,mean_ms).
bool WriteLatencySeriesCsv(const analysis::LatencySeries& series,
                           const std::filesystem::path& output_dir,
                           std::filesystem::path& written_path, std::string& error);

// Emits `<output_dir>/chart-<target>.json`.
bool WriteLatencySeriesJson(const analysis::LatencySeries& series,
                            const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error);

} // namespace hopmap::artifacts
