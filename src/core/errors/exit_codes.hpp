#pragma once

namespace hopmap::core::errors {

// Stable process-exit contract for scripts wrapping `hopmap`.
//
// The first three values keep conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The rest classify why an ingest or report was refused so cron jobs can tell
// an unreachable target apart from a format problem without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kStoreInvalid = 10,
  kProbeOutputRejected = 20,
  kProbeInvalidArgument = 21,
  kTargetUnresolved = 30,
  kUnknownDialect = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace hopmap::core::errors
