#include "artifacts/stats_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cstdint>
#include <optional>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace hopmap::artifacts {

namespace {

using JsonValue = core::json::Value;

constexpr int kCsvPrecision = 3;
constexpr std::string_view kNoDataCell = "no_data";
constexpr std::string_view kMissingHopCell = "missing";

std::string CsvField(std::string_view raw) {
  if (raw.find_first_of(",\"\n") == std::string_view::npos) {
    return std::string(raw);
  }
  std::string quoted = "\"";
  for (const char c : raw) {
    if (c == '"') {
      quoted += "\"\"";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "\"";
  return quoted;
}

std::string CsvNumber(const std::optional<double>& value) {
  return value.has_value() ? core::FormatFixedDouble(value.value(), kCsvPrecision) : "-";
}

void WriteStatsColumns(std::ostringstream& out, const analysis::AggregateStats& stats) {
  out << stats.count << ',' << CsvNumber(stats.mean_ms) << ',' << CsvNumber(stats.min_ms) << ','
      << CsvNumber(stats.max_ms) << ',' << CsvNumber(stats.stdev_ms);
}

std::string JoinHosts(const std::vector<std::string>& hosts) {
  std::string joined;
  for (const auto& host : hosts) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += host;
  }
  return joined;
}

JsonValue OptionalNumber(const std::optional<double>& value) {
  return value.has_value() ? JsonValue::MakeNumber(value.value()) : JsonValue{};
}

JsonValue StatsToJson(const analysis::AggregateStats& stats) {
  JsonValue object = JsonValue::MakeObject();
  object.object_value["count"] = JsonValue::MakeNumber(static_cast<double>(stats.count));
  object.object_value["mean_ms"] = OptionalNumber(stats.mean_ms);
  object.object_value["min_ms"] = OptionalNumber(stats.min_ms);
  object.object_value["max_ms"] = OptionalNumber(stats.max_ms);
  object.object_value["stdev_ms"] = OptionalNumber(stats.stdev_ms);
  return object;
}

bool Publish(const fs::path& output_dir, const std::string& file_name, const std::string& text,
             fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }
  written_path = output_dir / file_name;
  return core::WriteTextFileAtomic(written_path, text, error);
}

std::string TargetFileStem(const std::string& target) {
  return "stats-" + SanitizeFileComponent(target);
}

std::string ChartFileStem(const std::string& target) {
  return "chart-" + SanitizeFileComponent(target);
}

std::string MatrixCellCsv(const analysis::LatencyMatrixCell& cell) {
  switch (cell.kind) {
  case analysis::MatrixCellKind::kValue:
    return CsvNumber(cell.mean_ms);
  case analysis::MatrixCellKind::kNoData:
    return std::string(kNoDataCell);
  case analysis::MatrixCellKind::kMissingHop:
    break;
  }
  return std::string(kMissingHopCell);
}

JsonValue MatrixCellJson(const analysis::LatencyMatrixCell& cell) {
  switch (cell.kind) {
  case analysis::MatrixCellKind::kValue:
    return OptionalNumber(cell.mean_ms);
  case analysis::MatrixCellKind::kNoData:
    return JsonValue::MakeString(std::string(kNoDataCell));
  case analysis::MatrixCellKind::kMissingHop:
    break;
  }
  return JsonValue::MakeString(std::string(kMissingHopCell));
}

} // namespace

bool WriteTargetStatsCsv(const analysis::TargetLatencyReport& report, const fs::path& output_dir,
                         fs::path& written_path, std::string& error) {
  std::ostringstream out;
  out << "hop,hosts,count,mean_ms,min_ms,max_ms,stdev_ms\n";
  for (const auto& row : report.per_hop) {
    out << row.index << ',' << CsvField(JoinHosts(row.hosts)) << ',';
    WriteStatsColumns(out, row.stats);
    out << '\n';
  }
  out << "total,,";
  WriteStatsColumns(out, report.total);
  out << '\n';

  return Publish(output_dir, TargetFileStem(report.target) + ".csv", out.str(), written_path,
                 error);
}

bool WriteTargetStatsJson(const analysis::TargetLatencyReport& report,
                          const fs::path& output_dir, fs::path& written_path,
                          std::string& error) {
  JsonValue root = JsonValue::MakeObject();
  root.object_value["target"] = JsonValue::MakeString(report.target);
  root.object_value["entries"] = JsonValue::MakeNumber(static_cast<double>(report.entries));
  root.object_value["empty_entries"] =
      JsonValue::MakeNumber(static_cast<double>(report.empty_entries));
  root.object_value["max_hops"] = JsonValue::MakeNumber(static_cast<double>(report.max_hops));
  root.object_value["total"] = StatsToJson(report.total);

  JsonValue hops = JsonValue::MakeArray();
  for (const auto& row : report.per_hop) {
    JsonValue entry = StatsToJson(row.stats);
    entry.object_value["hop"] = JsonValue::MakeNumber(static_cast<double>(row.index));
    JsonValue hosts = JsonValue::MakeArray();
    for (const auto& host : row.hosts) {
      hosts.array_value.push_back(JsonValue::MakeString(host));
    }
    entry.object_value["hosts"] = std::move(hosts);
    hops.array_value.push_back(std::move(entry));
  }
  root.object_value["hops"] = std::move(hops);

  return Publish(output_dir, TargetFileStem(report.target) + ".json",
                 core::json::Serialize(root, 2) + "\n", written_path, error);
}

bool WriteSummaryCsv(const std::vector<analysis::TargetSummaryRow>& rows,
                     const fs::path& output_dir, fs::path& written_path, std::string& error) {
  std::ostringstream out;
  out << "target,entries,empty_entries,count,mean_ms,min_ms,max_ms,stdev_ms\n";
  for (const auto& row : rows) {
    out << CsvField(row.target) << ',' << row.entries << ',' << row.empty_entries << ',';
    WriteStatsColumns(out, row.stats);
    out << '\n';
  }
  return Publish(output_dir, "summary.csv", out.str(), written_path, error);
}

bool WriteSummaryJson(const analysis::StoreSummary& summary,
                      const std::vector<analysis::TargetSummaryRow>& rows,
                      const fs::path& output_dir, fs::path& written_path, std::string& error) {
  JsonValue root = JsonValue::MakeObject();
  root.object_value["target_count"] =
      JsonValue::MakeNumber(static_cast<double>(summary.target_count));
  root.object_value["entries"] = JsonValue::MakeNumber(static_cast<double>(summary.entries));
  root.object_value["empty_entries"] =
      JsonValue::MakeNumber(static_cast<double>(summary.empty_entries));
  root.object_value["average_hops_per_target"] = OptionalNumber(summary.average_hops_per_target);
  root.object_value["total"] = StatsToJson(summary.total);

  JsonValue targets = JsonValue::MakeArray();
  for (const auto& row : rows) {
    JsonValue entry = StatsToJson(row.stats);
    entry.object_value["target"] = JsonValue::MakeString(row.target);
    entry.object_value["entries"] = JsonValue::MakeNumber(static_cast<double>(row.entries));
    entry.object_value["empty_entries"] =
        JsonValue::MakeNumber(static_cast<double>(row.empty_entries));
    targets.array_value.push_back(std::move(entry));
  }
  root.object_value["targets"] = std::move(targets);

  return Publish(output_dir, "summary.json", core::json::Serialize(root, 2) + "\n", written_path,
                 error);
}

bool WriteLatencyMatrixCsv(const analysis::LatencyMatrix& matrix, const fs::path& output_dir,
                           fs::path& written_path, std::string& error) {
  std::ostringstream out;
  out << "target";
  for (const std::uint32_t index : matrix.hop_indices) {
    out << ',' << index;
  }
  out << '\n';
  for (const auto& row : matrix.rows) {
    out << CsvField(row.target);
    for (const auto& cell : row.cells) {
      out << ',' << MatrixCellCsv(cell);
    }
    out << '\n';
  }
  return Publish(output_dir, "chart.csv", out.str(), written_path, error);
}

bool WriteLatencyMatrixJson(const analysis::LatencyMatrix& matrix, const fs::path& output_dir,
                            fs::path& written_path, std::string& error) {
  JsonValue root = JsonValue::MakeObject();
  JsonValue hops = JsonValue::MakeArray();
  for (const std::uint32_t index : matrix.hop_indices) {
    hops.array_value.push_back(JsonValue::MakeNumber(static_cast<double>(index)));
  }
  root.object_value["hops"] = std::move(hops);

  JsonValue targets = JsonValue::MakeArray();
  for (const auto& row : matrix.rows) {
    JsonValue entry = JsonValue::MakeObject();
    entry.object_value["target"] = JsonValue::MakeString(row.target);
    JsonValue cells = JsonValue::MakeArray();
    for (const auto& cell : row.cells) {
      cells.array_value.push_back(MatrixCellJson(cell));
    }
    entry.object_value["cells"] = std::move(cells);
    targets.array_value.push_back(std::move(entry));
  }
  root.object_value["targets"] = std::move(targets);

  return Publish(output_dir, "chart.json", core::json::Serialize(root, 2) + "\n", written_path,
                 error);
}

bool WriteLatencySeriesCsv(const analysis::LatencySeries& series, const fs::path& output_dir,
                           fs::path& written_path, std::string& error) {
  std::ostringstream out;
  out << "hop,label,mean_ms\n";
  for (const auto& bar : series.bars) {
    out << bar.index << ',' << CsvField(bar.label) << ',' << CsvNumber(bar.mean_ms) << '\n';
  }
  return Publish(output_dir, ChartFileStem(series.target) + ".csv", out.str(), written_path,
                 error);
}

bool WriteLatencySeriesJson(const analysis::LatencySeries& series, const fs::path& output_dir,
                            fs::path& written_path, std::string& error) {
  JsonValue root = JsonValue::MakeObject();
  root.object_value["target"] = JsonValue::MakeString(series.target);
  JsonValue bars = JsonValue::MakeArray();
  for (const auto& bar : series.bars) {
    JsonValue entry = JsonValue::MakeObject();
    entry.object_value["hop"] = JsonValue::MakeNumber(static_cast<double>(bar.index));
    entry.object_value["label"] = JsonValue::MakeString(bar.label);
    entry.object_value["mean_ms"] = OptionalNumber(bar.mean_ms);
    bars.array_value.push_back(std::move(entry));
  }
  root.object_value["bars"] = std::move(bars);

  return Publish(output_dir, ChartFileStem(series.target) + ".json",
                 core::json::Serialize(root, 2) + "\n", written_path, error);
}

} // namespace hopmap::artifacts
