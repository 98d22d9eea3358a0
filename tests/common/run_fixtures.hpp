#ifndef HOPMAP_TESTS_COMMON_RUN_FIXTURES_HPP_
#define HOPMAP_TESTS_COMMON_RUN_FIXTURES_HPP_

#include "assertions.hpp"
#include "probe/run_result.hpp"
#include "store/run_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hopmap::tests::common {

// Captured `traceroute -q 3 example.com` output from the modern Linux tool.
inline constexpr std::string_view kModernTranscript =
    "traceroute to example.com (93.184.216.34), 30 hops max, 60 byte packets\n"
    " 1  gateway (192.168.1.1)  0.512 ms  0.498 ms  0.471 ms\n"
    " 2  * * *\n"
    " 3  93.184.216.34 (93.184.216.34)  11.2 ms  12.0 ms *\n"
    "\n";

// Same path as printed by GNU inetutils traceroute.
inline constexpr std::string_view kInetutilsTranscript =
    "traceroute to example.com (93.184.216.34), 64 hops max\n"
    "  1   192.168.1.1 (gateway)  0.512ms  0.498ms  0.471ms\n"
    "  2   *  *  *\n"
    "  3   93.184.216.34  11.200ms  12.000ms  *\n";

inline constexpr std::string_view kUnresolvedTranscript =
    "example.invalid: Name or service not known\n"
    "Cannot handle \"host\" cmdline arg `example.invalid' on position 1 (argc 1)\n";

inline probe::HopRecord MakeHop(std::uint32_t index, std::vector<std::string> addresses,
                                std::vector<double> samples, std::uint32_t timeouts = 0,
                                std::optional<std::string> hostname = std::nullopt) {
  probe::HopRecord hop;
  hop.index = index;
  hop.addresses = std::move(addresses);
  hop.samples = std::move(samples);
  hop.timeouts = timeouts;
  hop.hostname = std::move(hostname);
  return hop;
}

// Fixed timestamp so serialized fixtures are stable across test runs.
inline probe::RunResult MakeRun(std::string target, std::vector<probe::HopRecord> hops) {
  probe::RunResult run;
  run.target = std::move(target);
  run.command_text = "traceroute -q 3 " + run.target;
  run.description = "traceroute to " + run.target + ", 30 hops max, 60 byte packets";
  run.timestamp = std::chrono::sys_days{std::chrono::year{2024} / 3 / 14} +
                  std::chrono::hours{9} + std::chrono::minutes{26} +
                  std::chrono::milliseconds{535};
  run.duration_seconds = 1.25;
  run.hops = std::move(hops);
  return run;
}

inline store::RunStore MakeStore(std::vector<probe::RunResult> runs) {
  store::RunStore store;
  for (auto& run : runs) {
    store.Append(std::move(run));
  }
  return store;
}

inline void WriteFixtureFile(const std::filesystem::path& path, std::string_view contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to open fixture file: " + path.string());
  }
  out << contents;
  if (!out) {
    Fail("failed to write fixture file: " + path.string());
  }
}

} // namespace hopmap::tests::common

#endif // HOPMAP_TESTS_COMMON_RUN_FIXTURES_HPP_
