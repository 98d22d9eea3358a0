#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace hopmap::cli {

// Options for `hopmap ingest`. Dialect and probe count are validated before
// any transcript line is read.
struct IngestOptions {
  std::filesystem::path store_path;
  std::string target;
  std::string dialect = "modern";
  std::uint32_t tries = 3;
  std::string command_text;
  // Empty means stdin.
  std::filesystem::path input_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options shared by the read-only commands (`stats`, `table`, `chart`, `map`).
// An empty target list means every target in the store.
struct ReportOptions {
  std::filesystem::path store_path;
  std::vector<std::string> targets;
  std::filesystem::path output_dir;
  bool has_output_dir = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Reads one transcript from `input` and appends the resulting run to the
// store file. Exposed so callers that already hold the probe output stream
// (tests, wrappers that spawn the tool themselves) skip the file round trip.
int ExecuteIngest(const IngestOptions& options, std::istream& input);

// Routes `hopmap` subcommands and returns process exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => store file is not a store document
//   20 => probe output rejected (malformed hop line, probe count mismatch)
//   21 => probe tool reported invalid arguments
//   30 => target could not be resolved
//   40 => unknown dialect
int Dispatch(int argc, char** argv);

} // namespace hopmap::cli
