#pragma once

#include "probe/dialect.hpp"
#include "probe/probe_error.hpp"
#include "probe/run_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace hopmap::probe {

// Parses one hop line of traceroute output.
//
// Contract:
// - the first whitespace-delimited token must be a non-negative integer hop
//   index, otherwise kMalformedHopLine.
// - every remaining token is classified under `dialect`; timeouts and timings
//   together must account for exactly `expected_tries` probes, otherwise
//   kProbeCountMismatch.
// - a name that matches the sole address, or that sits beside several
//   addresses, is dropped; when `dropped_hostname` is non-null it receives the
//   discarded name.
// - `hop` is only written on success.
bool ParseHopLine(std::string_view line, Dialect dialect, std::uint32_t expected_tries,
                  HopRecord& hop, ProbeError& error, std::string* dropped_hostname = nullptr);

} // namespace hopmap::probe
