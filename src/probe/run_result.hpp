#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hopmap::probe {

// One TTL step of one run.
//
// `addresses` keeps first-seen order without duplicates; more than one entry
// means probes for this TTL came back from different interfaces. `hostname`
// survives parsing only when it can be tied to a single address.
struct HopRecord {
  std::uint32_t index = 0;
  std::vector<std::string> addresses;
  std::optional<std::string> hostname;
  std::vector<double> samples;
  std::uint32_t timeouts = 0;

  bool operator==(const HopRecord& other) const = default;
};

// One invocation of the probe tool against one target. An empty `hops` is
// the "no data" sentinel: the run was attempted but recorded no path.
struct RunResult {
  std::string target;
  std::string command_text;
  std::string description;
  std::chrono::system_clock::time_point timestamp{};
  double duration_seconds = 0.0;
  std::vector<HopRecord> hops;

  bool HasData() const {
    return !hops.empty();
  }

  bool operator==(const RunResult& other) const = default;
};

} // namespace hopmap::probe
