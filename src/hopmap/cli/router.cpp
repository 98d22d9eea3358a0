#include "hopmap/cli/router.hpp"

#include "analysis/latency_stats.hpp"
#include "analysis/topology.hpp"
#include "artifacts/stats_writer.hpp"
#include "artifacts/topology_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "probe/dialect.hpp"
#include "probe/line_source.hpp"
#include "probe/probe_error.hpp"
#include "probe/run_assembler.hpp"
#include "store/run_store.hpp"
#include "store/store_file.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace hopmap::cli {

namespace {

constexpr std::string_view kVersion = "hopmap 0.1.0";

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitStoreInvalid = core::errors::ToInt(core::errors::ExitCode::kStoreInvalid);
constexpr int kExitProbeOutputRejected =
    core::errors::ToInt(core::errors::ExitCode::kProbeOutputRejected);
constexpr int kExitProbeInvalidArgument =
    core::errors::ToInt(core::errors::ExitCode::kProbeInvalidArgument);
constexpr int kExitTargetUnresolved =
    core::errors::ToInt(core::errors::ExitCode::kTargetUnresolved);
constexpr int kExitUnknownDialect = core::errors::ToInt(core::errors::ExitCode::kUnknownDialect);

constexpr int kConsolePrecision = 2;

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  hopmap ingest <store.json> --target <host> [--dialect <modern|inetutils>] "
         "[--tries <n>] [--cmd <text>] [--input <file>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  hopmap info <store.json>\n"
      << "  hopmap targets <store.json>\n"
      << "  hopmap stats <store.json> [<target>...] [--out <dir>]\n"
      << "  hopmap table <store.json> [<target>...] [--out <dir>]\n"
      << "  hopmap chart <store.json> [<target>...] [--out <dir>]\n"
      << "  hopmap map <store.json> [<target>...] [--out <dir>]\n"
      << "  hopmap version\n";
}

int ExitCodeFor(probe::ProbeErrorCode code) {
  switch (code) {
  case probe::ProbeErrorCode::kMalformedHopLine:
  case probe::ProbeErrorCode::kProbeCountMismatch:
    return kExitProbeOutputRejected;
  case probe::ProbeErrorCode::kInvalidArgument:
    return kExitProbeInvalidArgument;
  case probe::ProbeErrorCode::kUnresolvedHost:
    return kExitTargetUnresolved;
  case probe::ProbeErrorCode::kUnknownDialect:
    return kExitUnknownDialect;
  case probe::ProbeErrorCode::kNone:
    break;
  }
  return kExitFailure;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool ParseTries(std::string_view raw, std::uint32_t& tries, std::string& error) {
  std::uint32_t parsed = 0;
  const char* const end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(raw.data(), end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid --tries '" + std::string(raw) + "' (expected a positive integer)";
    return false;
  }
  if (parsed == 0U) {
    error = "--tries must be at least 1";
    return false;
  }
  tries = parsed;
  return true;
}

bool ParseLogLevelFlag(const std::vector<std::string_view>& args, std::size_t& i,
                       core::logging::LogLevel& level, std::string& error) {
  std::string raw;
  if (!TakeValue(args, i, "--log-level", raw, error)) {
    return false;
  }
  return core::logging::ParseLogLevel(raw, level, error);
}

// Parse `ingest` args with an explicit contract:
// - exactly one store path
// - `--target` is required, every other flag has a default
// Unknown flags and extra positionals are usage errors.
bool ParseIngestOptions(const std::vector<std::string_view>& args, IngestOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--target") {
      if (!TakeValue(args, i, token, options.target, error)) {
        return false;
      }
      continue;
    }
    if (token == "--dialect") {
      if (!TakeValue(args, i, token, options.dialect, error)) {
        return false;
      }
      continue;
    }
    if (token == "--tries") {
      if (!TakeValue(args, i, token, value, error) || !ParseTries(value, options.tries, error)) {
        return false;
      }
      continue;
    }
    if (token == "--cmd") {
      if (!TakeValue(args, i, token, options.command_text, error)) {
        return false;
      }
      continue;
    }
    if (token == "--input") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.input_path = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.store_path.empty()) {
      error = "ingest accepts exactly 1 store path";
      return false;
    }
    options.store_path = fs::path(token);
  }

  if (options.store_path.empty()) {
    error = "ingest requires exactly 1 argument: <store.json>";
    return false;
  }
  if (options.target.empty()) {
    error = "ingest requires --target <host>";
    return false;
  }
  return true;
}

// Parse the report contract shared by stats/table/chart/map:
// - first positional is the store path, the rest are targets
// - optional `--out <dir>` and `--log-level <level>`
bool ParseReportOptions(std::string_view command, const std::vector<std::string_view>& args,
                        ReportOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--out") {
      std::string value;
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      options.has_output_dir = true;
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (options.store_path.empty()) {
      options.store_path = fs::path(token);
    } else {
      options.targets.emplace_back(token);
    }
  }

  if (options.store_path.empty()) {
    error = std::string(command) + " requires a store path: <store.json>";
    return false;
  }
  return true;
}

// `info` and `targets` describe the whole store and take nothing else.
bool ParseStoreOnlyOptions(std::string_view command, const std::vector<std::string_view>& args,
                           ReportOptions& options, std::string& error) {
  if (!ParseReportOptions(command, args, options, error)) {
    return false;
  }
  if (!options.targets.empty() || options.has_output_dir) {
    error = std::string(command) + " accepts exactly 1 argument: <store.json>";
    return false;
  }
  return true;
}

// Reporting never creates a store, so a missing file is an error here even
// though LoadStoreFile treats it as empty.
int LoadStoreForReport(const ReportOptions& options, store::RunStore& store,
                       core::logging::Logger& logger) {
  std::error_code ec;
  if (!fs::is_regular_file(options.store_path, ec) || ec) {
    logger.Error("store file not found", {{"store", options.store_path.string()}});
    std::cerr << "error: store file not found: " << options.store_path.string() << '\n';
    return kExitFailure;
  }

  std::string error;
  store::StoreFileFailure failure = store::StoreFileFailure::kNone;
  if (!store::LoadStoreFile(options.store_path, store, error, &failure)) {
    logger.Error("store load failed", {{"store", options.store_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return failure == store::StoreFileFailure::kFormat ? kExitStoreInvalid : kExitFailure;
  }
  return kExitSuccess;
}

// Empty request means every target. Unknown targets fail the command so a
// typo never silently produces an empty report.
bool ResolveTargets(const store::RunStore& store, const std::vector<std::string>& requested,
                    std::vector<std::string>& targets, std::string& error) {
  if (requested.empty()) {
    targets = store.Targets();
    return true;
  }
  targets.clear();
  for (const auto& target : requested) {
    if (!store.Contains(target)) {
      error = "target not in store: " + target;
      return false;
    }
    if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
      targets.push_back(target);
    }
  }
  return true;
}

std::string ConsoleNumber(const std::optional<double>& value) {
  return value.has_value() ? core::FormatFixedDouble(value.value(), kConsolePrecision) : "-";
}

void PrintStatsBlock(std::ostream& out, const analysis::AggregateStats& stats) {
  out << "samples: " << stats.count << '\n';
  out << "mean_ms: " << ConsoleNumber(stats.mean_ms) << '\n';
  out << "min_ms: " << ConsoleNumber(stats.min_ms) << '\n';
  out << "max_ms: " << ConsoleNumber(stats.max_ms) << '\n';
  out << "stdev_ms: " << ConsoleNumber(stats.stdev_ms) << '\n';
}

void PrintTable(std::ostream& out, const std::vector<std::string>& header,
                const std::vector<std::vector<std::string>>& rows) {
  std::vector<std::size_t> widths(header.size(), 0U);
  for (std::size_t c = 0; c < header.size(); ++c) {
    widths[c] = header[c].size();
  }
  for (const auto& row : rows) {
    for (std::size_t c = 0; c < row.size() && c < widths.size(); ++c) {
      widths[c] = std::max(widths[c], row[c].size());
    }
  }

  const auto print_row = [&](const std::vector<std::string>& cells) {
    for (std::size_t c = 0; c < cells.size() && c < widths.size(); ++c) {
      if (c > 0U) {
        out << "  ";
      }
      out << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
    }
    out << std::right << '\n';
  };

  print_row(header);
  for (const auto& row : rows) {
    print_row(row);
  }
}

std::vector<std::string> StatsCells(const analysis::AggregateStats& stats) {
  return {std::to_string(stats.count), ConsoleNumber(stats.mean_ms), ConsoleNumber(stats.min_ms),
          ConsoleNumber(stats.max_ms), ConsoleNumber(stats.stdev_ms)};
}

void PrintSection(std::ostream& out, std::string_view title) {
  out << "== " << title << " ==\n";
}

// Dialect and probe count are checked before the transcript is opened.
int ValidateIngestConfig(const IngestOptions& options, probe::Dialect& dialect,
                         core::logging::Logger& logger) {
  probe::ProbeError probe_error;
  if (!probe::ParseDialect(options.dialect, dialect, probe_error)) {
    logger.Error("dialect rejected", {{"dialect", options.dialect},
                                      {"code", probe::ToString(probe_error.code)}});
    std::cerr << "error: " << probe_error.message << '\n';
    return ExitCodeFor(probe_error.code);
  }
  if (options.tries == 0U) {
    std::cerr << "error: --tries must be at least 1\n";
    return kExitUsage;
  }
  logger.Debug("probe configuration accepted",
               {{"dialect", probe::ToString(dialect)}, {"tries", std::to_string(options.tries)}});
  return kExitSuccess;
}

// Assembles one run from an already validated configuration and appends it.
int IngestTranscript(const IngestOptions& options, probe::Dialect dialect, std::istream& input,
                     core::logging::Logger& logger) {
  const probe::RunRequest request{
      .target = options.target,
      .command_text = options.command_text,
      .dialect = dialect,
      .expected_tries = options.tries,
  };

  probe::StreamLineSource source(input);
  probe::RunResult run;
  probe::ProbeError probe_error;
  if (!probe::AssembleRun(source, request, run, probe_error, &logger)) {
    std::cerr << "error: " << probe_error.message << '\n';
    return ExitCodeFor(probe_error.code);
  }

  std::string error;
  store::StoreFileFailure failure = store::StoreFileFailure::kNone;
  if (!store::AppendRunToStoreFile(options.store_path, run, error, &failure)) {
    logger.Error("store append failed",
                 {{"store", options.store_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return failure == store::StoreFileFailure::kFormat ? kExitStoreInvalid : kExitFailure;
  }
  logger.Info("run appended to store", {{"store", options.store_path.string()},
                                        {"hops", std::to_string(run.hops.size())}});

  std::cout << "target: " << run.target << '\n';
  std::cout << "dialect: " << probe::ToString(dialect) << '\n';
  std::cout << "hops: " << run.hops.size() << '\n';
  std::cout << "store: " << options.store_path.string() << '\n';
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandIngest(const std::vector<std::string_view>& args) {
  IngestOptions options;
  std::string error;
  if (!ParseIngestOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetTarget(options.target);
  probe::Dialect dialect = probe::Dialect::kModern;
  if (const int rc = ValidateIngestConfig(options, dialect, logger); rc != kExitSuccess) {
    return rc;
  }

  if (options.input_path.empty()) {
    return IngestTranscript(options, dialect, std::cin, logger);
  }

  std::ifstream input(options.input_path);
  if (!input) {
    std::cerr << "error: unable to open input file: " << options.input_path.string() << '\n';
    return kExitFailure;
  }
  return IngestTranscript(options, dialect, input, logger);
}

int CommandInfo(const std::vector<std::string_view>& args) {
  ReportOptions options;
  std::string error;
  if (!ParseStoreOnlyOptions("info", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  store::RunStore store;
  if (const int rc = LoadStoreForReport(options, store, logger); rc != kExitSuccess) {
    return rc;
  }

  std::cout << "store: " << options.store_path.string() << '\n';
  std::cout << "targets: " << store.Targets().size() << '\n';
  std::cout << "entries: " << store.TotalEntryCount() << '\n';
  std::cout << "empty_entries: " << store.TotalEmptyEntryCount() << '\n';
  return kExitSuccess;
}

int CommandTargets(const std::vector<std::string_view>& args) {
  ReportOptions options;
  std::string error;
  if (!ParseStoreOnlyOptions("targets", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  store::RunStore store;
  if (const int rc = LoadStoreForReport(options, store, logger); rc != kExitSuccess) {
    return rc;
  }

  std::vector<std::vector<std::string>> rows;
  for (const auto& target : store.Targets()) {
    rows.push_back({target, std::to_string(store.EntryCount(target)),
                    std::to_string(store.EmptyEntryCount(target))});
  }
  PrintTable(std::cout, {"target", "entries", "empty_entries"}, rows);
  return kExitSuccess;
}

int CommandStats(const std::vector<std::string_view>& args) {
  ReportOptions options;
  std::string error;
  if (!ParseReportOptions("stats", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  store::RunStore store;
  if (const int rc = LoadStoreForReport(options, store, logger); rc != kExitSuccess) {
    return rc;
  }

  if (options.targets.empty()) {
    const analysis::StoreSummary summary = analysis::SummarizeStore(store);
    PrintSection(std::cout, "all targets");
    std::cout << "targets: " << summary.target_count << '\n';
    std::cout << "entries: " << summary.entries << '\n';
    std::cout << "empty_entries: " << summary.empty_entries << '\n';
    std::cout << "average_hops_per_target: " << ConsoleNumber(summary.average_hops_per_target)
              << '\n';
    PrintStatsBlock(std::cout, summary.total);

    if (options.has_output_dir) {
      fs::path written;
      if (!artifacts::WriteSummaryJson(summary, analysis::StatsForAll(store), options.output_dir,
                                       written, error)) {
        std::cerr << "error: failed to write summary.json: " << error << '\n';
        return kExitFailure;
      }
      std::cout << "summary_json: " << written.string() << '\n';
    }
    return kExitSuccess;
  }

  std::vector<std::string> targets;
  if (!ResolveTargets(store, options.targets, targets, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& target : targets) {
    const analysis::TargetLatencyReport report = analysis::StatsFor(store, target);
    PrintSection(std::cout, target);
    std::cout << "entries: " << report.entries << '\n';
    std::cout << "empty_entries: " << report.empty_entries << '\n';
    std::cout << "max_hops: " << report.max_hops << '\n';
    PrintStatsBlock(std::cout, report.total);

    if (options.has_output_dir) {
      fs::path written;
      if (!artifacts::WriteTargetStatsJson(report, options.output_dir, written, error)) {
        std::cerr << "error: failed to write stats for '" << target << "': " << error << '\n';
        return kExitFailure;
      }
      std::cout << "stats_json: " << written.string() << '\n';
    }
  }
  return kExitSuccess;
}

int CommandTable(const std::vector<std::string_view>& args) {
  ReportOptions options;
  std::string error;
  if (!ParseReportOptions("table", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  store::RunStore store;
  if (const int rc = LoadStoreForReport(options, store, logger); rc != kExitSuccess) {
    return rc;
  }

  if (options.targets.empty()) {
    const std::vector<analysis::TargetSummaryRow> summary_rows = analysis::StatsForAll(store);
    std::vector<std::vector<std::string>> rows;
    for (const auto& summary_row : summary_rows) {
      std::vector<std::string> row = {summary_row.target};
      const std::vector<std::string> cells = StatsCells(summary_row.stats);
      row.insert(row.end(), cells.begin(), cells.end());
      rows.push_back(std::move(row));
    }
    PrintSection(std::cout, "all targets");
    PrintTable(std::cout, {"target", "rcvd", "mean_ms", "min_ms", "max_ms", "stdev_ms"}, rows);

    if (options.has_output_dir) {
      fs::path written;
      if (!artifacts::WriteSummaryCsv(summary_rows, options.output_dir, written, error)) {
        std::cerr << "error: failed to write summary.csv: " << error << '\n';
        return kExitFailure;
      }
      std::cout << "summary_csv: " << written.string() << '\n';
    }
    return kExitSuccess;
  }

  std::vector<std::string> targets;
  if (!ResolveTargets(store, options.targets, targets, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& target : targets) {
    const analysis::TargetLatencyReport report = analysis::StatsFor(store, target);
    PrintSection(std::cout, target);
    if (report.per_hop.empty()) {
      std::cout << "no data\n";
    } else {
      std::vector<std::vector<std::string>> rows;
      for (const auto& hop_row : report.per_hop) {
        std::string hosts;
        for (const auto& host : hop_row.hosts) {
          hosts += hosts.empty() ? host : ", " + host;
        }
        std::vector<std::string> row = {std::to_string(hop_row.index), hosts};
        const std::vector<std::string> cells = StatsCells(hop_row.stats);
        row.insert(row.end(), cells.begin(), cells.end());
        rows.push_back(std::move(row));
      }
      PrintTable(std::cout, {"hop", "hosts", "rcvd", "mean_ms", "min_ms", "max_ms", "stdev_ms"},
                 rows);
    }

    if (options.has_output_dir) {
      fs::path written;
      if (!artifacts::WriteTargetStatsCsv(report, options.output_dir, written, error)) {
        std::cerr << "error: failed to write table for '" << target << "': " << error << '\n';
        return kExitFailure;
      }
      std::cout << "stats_csv: " << written.string() << '\n';
    }
  }
  return kExitSuccess;
}

std::string MatrixCellText(const analysis::LatencyMatrixCell& cell) {
  switch (cell.kind) {
  case analysis::MatrixCellKind::kValue:
    return ConsoleNumber(cell.mean_ms);
  case analysis::MatrixCellKind::kNoData:
    return "no data";
  case analysis::MatrixCellKind::kMissingHop:
    break;
  }
  return "";
}

// Without targets: the targets x hops average matrix. With targets: one bar
// series per target.
int CommandChart(const std::vector<std::string_view>& args) {
  ReportOptions options;
  std::string error;
  if (!ParseReportOptions("chart", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  store::RunStore store;
  if (const int rc = LoadStoreForReport(options, store, logger); rc != kExitSuccess) {
    return rc;
  }

  if (options.targets.empty()) {
    const analysis::LatencyMatrix matrix = analysis::ComputeLatencyMatrix(store, {});
    std::vector<std::string> header = {"target"};
    for (const std::uint32_t index : matrix.hop_indices) {
      header.push_back(std::to_string(index));
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& matrix_row : matrix.rows) {
      std::vector<std::string> row = {matrix_row.target};
      for (const auto& cell : matrix_row.cells) {
        row.push_back(MatrixCellText(cell));
      }
      rows.push_back(std::move(row));
    }
    PrintSection(std::cout, "average latency by hop");
    PrintTable(std::cout, header, rows);

    if (options.has_output_dir) {
      fs::path csv_path;
      fs::path json_path;
      if (!artifacts::WriteLatencyMatrixCsv(matrix, options.output_dir, csv_path, error) ||
          !artifacts::WriteLatencyMatrixJson(matrix, options.output_dir, json_path, error)) {
        std::cerr << "error: failed to write chart data: " << error << '\n';
        return kExitFailure;
      }
      std::cout << "chart_csv: " << csv_path.string() << '\n';
      std::cout << "chart_json: " << json_path.string() << '\n';
    }
    return kExitSuccess;
  }

  std::vector<std::string> targets;
  if (!ResolveTargets(store, options.targets, targets, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& target : targets) {
    const analysis::LatencySeries series = analysis::ComputeLatencySeries(store, target);
    PrintSection(std::cout, target);
    if (series.bars.empty()) {
      std::cout << "no data\n";
    } else {
      std::vector<std::vector<std::string>> rows;
      for (const auto& bar : series.bars) {
        rows.push_back({std::to_string(bar.index), bar.label, ConsoleNumber(bar.mean_ms)});
      }
      PrintTable(std::cout, {"hop", "label", "mean_ms"}, rows);
    }

    if (options.has_output_dir) {
      fs::path csv_path;
      fs::path json_path;
      if (!artifacts::WriteLatencySeriesCsv(series, options.output_dir, csv_path, error) ||
          !artifacts::WriteLatencySeriesJson(series, options.output_dir, json_path, error)) {
        std::cerr << "error: failed to write chart for '" << target << "': " << error << '\n';
        return kExitFailure;
      }
      std::cout << "chart_csv: " << csv_path.string() << '\n';
      std::cout << "chart_json: " << json_path.string() << '\n';
    }
  }
  return kExitSuccess;
}

int CommandMap(const std::vector<std::string_view>& args) {
  ReportOptions options;
  std::string error;
  if (!ParseReportOptions("map", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  store::RunStore store;
  if (const int rc = LoadStoreForReport(options, store, logger); rc != kExitSuccess) {
    return rc;
  }

  std::vector<std::string> targets;
  if (!ResolveTargets(store, options.targets, targets, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  const analysis::TopologyGraph graph = analysis::BuildTopology(store, targets);
  logger.Debug("topology built", {{"nodes", std::to_string(graph.nodes.size())},
                                  {"edges", std::to_string(graph.edges.size())}});

  if (!options.has_output_dir) {
    std::cout << artifacts::FormatTopologyDot(graph);
    return kExitSuccess;
  }

  fs::path dot_path;
  if (!artifacts::WriteTopologyDot(graph, options.output_dir, dot_path, error)) {
    std::cerr << "error: failed to write topology.dot: " << error << '\n';
    return kExitFailure;
  }
  fs::path json_path;
  if (!artifacts::WriteTopologyJson(graph, options.output_dir, json_path, error)) {
    std::cerr << "error: failed to write topology.json: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "topology_dot: " << dot_path.string() << '\n';
  std::cout << "topology_json: " << json_path.string() << '\n';
  std::cout << "nodes: " << graph.nodes.size() << '\n';
  std::cout << "edges: " << graph.edges.size() << '\n';
  return kExitSuccess;
}

} // namespace

int ExecuteIngest(const IngestOptions& options, std::istream& input) {
  core::logging::Logger logger(options.log_level);
  logger.SetTarget(options.target);

  probe::Dialect dialect = probe::Dialect::kModern;
  if (const int rc = ValidateIngestConfig(options, dialect, logger); rc != kExitSuccess) {
    return rc;
  }
  return IngestTranscript(options, dialect, input, logger);
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "ingest") {
    return CommandIngest(args);
  }

  if (command == "info") {
    return CommandInfo(args);
  }

  if (command == "targets") {
    return CommandTargets(args);
  }

  if (command == "stats") {
    return CommandStats(args);
  }

  if (command == "table") {
    return CommandTable(args);
  }

  if (command == "chart") {
    return CommandChart(args);
  }

  if (command == "map") {
    return CommandMap(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace hopmap::cli
