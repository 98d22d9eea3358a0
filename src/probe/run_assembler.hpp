#pragma once

#include "core/logging/logger.hpp"
#include "probe/dialect.hpp"
#include "probe/line_source.hpp"
#include "probe/probe_error.hpp"
#include "probe/run_result.hpp"

#include <cstdint>
#include <string>

namespace hopmap::probe {

// Everything the assembler needs to know about the run it is reading. The
// probe process itself is started by the caller; `command_text` is recorded
// verbatim.
struct RunRequest {
  std::string target;
  std::string command_text;
  Dialect dialect = Dialect::kModern;
  std::uint32_t expected_tries = 3;
};

// Builds one RunResult from a probe transcript.
//
// Protocol:
// - the first line is the banner; a "name or service not known" banner fails
//   with kUnresolvedHost before any hop is read.
// - following lines up to a blank line or end of stream are hop lines; a line
//   mentioning "invalid argument" fails with kInvalidArgument, any other line
//   goes through ParseHopLine and its failure aborts the run.
// - hop indices must strictly increase.
// - `duration_seconds` covers the hop loop only.
// - zero hop lines is success: `run.HasData()` is false.
//
// `logger` may be null.
bool AssembleRun(ILineSource& source, const RunRequest& request, RunResult& run,
                 ProbeError& error, core::logging::Logger* logger = nullptr);

} // namespace hopmap::probe
