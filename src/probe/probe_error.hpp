#pragma once

#include <string>

namespace hopmap::probe {

// Reasons a probe transcript (or its configuration) is refused. Every code is
// fatal to the run being assembled; runs already in the store are untouched.
enum class ProbeErrorCode {
  kNone,
  // First token of a hop line is not a hop index, or indices went backwards.
  kMalformedHopLine,
  // Timeouts plus timings on a line differ from the configured probe count.
  kProbeCountMismatch,
  // Banner line says the target name could not be resolved.
  kUnresolvedHost,
  // Probe tool complained about its own invocation.
  kInvalidArgument,
  // No classification rules exist for the requested dialect.
  kUnknownDialect,
};

struct ProbeError {
  ProbeErrorCode code = ProbeErrorCode::kNone;
  std::string message;
};

inline const char* ToString(ProbeErrorCode code) {
  switch (code) {
  case ProbeErrorCode::kNone:
    return "none";
  case ProbeErrorCode::kMalformedHopLine:
    return "malformed_hop_line";
  case ProbeErrorCode::kProbeCountMismatch:
    return "probe_count_mismatch";
  case ProbeErrorCode::kUnresolvedHost:
    return "unresolved_host";
  case ProbeErrorCode::kInvalidArgument:
    return "invalid_argument";
  case ProbeErrorCode::kUnknownDialect:
    return "unknown_dialect";
  }
  return "none";
}

inline bool SetProbeError(ProbeError& error, ProbeErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
  return false;
}

} // namespace hopmap::probe
