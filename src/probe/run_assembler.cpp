#include "probe/run_assembler.hpp"

#include "core/json_utils.hpp"
#include "probe/hop_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string_view>

namespace hopmap::probe {

namespace {

constexpr std::string_view kUnresolvedMarker = "name or service not known";
constexpr std::string_view kInvalidArgumentMarker = "invalid argument";

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

bool ContainsCaseInsensitive(std::string_view text, std::string_view lowercase_needle) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered.find(lowercase_needle) != std::string::npos;
}

} // namespace

bool AssembleRun(ILineSource& source, const RunRequest& request, RunResult& run,
                 ProbeError& error, core::logging::Logger* logger) {
  RunResult assembled;
  assembled.target = request.target;
  assembled.command_text = request.command_text;
  assembled.timestamp = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());

  if (logger != nullptr) {
    logger->Info("run started", {{"dialect", ToString(request.dialect)},
                                 {"tries", std::to_string(request.expected_tries)},
                                 {"cmd", request.command_text}});
  }

  std::string raw_line;
  if (source.ReadLine(raw_line)) {
    assembled.description = Trim(raw_line);
    if (ContainsCaseInsensitive(assembled.description, kUnresolvedMarker)) {
      if (logger != nullptr) {
        logger->Error("target could not be resolved",
                      {{"code", ToString(ProbeErrorCode::kUnresolvedHost)},
                       {"banner", assembled.description}});
      }
      return SetProbeError(error, ProbeErrorCode::kUnresolvedHost,
                           "name or service not known: " + request.target);
    }
  }

  const auto started = std::chrono::steady_clock::now();
  while (source.ReadLine(raw_line)) {
    const std::string line = Trim(raw_line);
    if (ContainsCaseInsensitive(line, kInvalidArgumentMarker)) {
      if (logger != nullptr) {
        logger->Error("probe tool rejected its arguments",
                      {{"code", ToString(ProbeErrorCode::kInvalidArgument)}, {"line", line}});
      }
      return SetProbeError(error, ProbeErrorCode::kInvalidArgument,
                           "probe tool reported an invalid argument: '" + line + "'");
    }
    if (line.empty()) {
      break;
    }

    HopRecord hop;
    std::string dropped_hostname;
    if (!ParseHopLine(line, request.dialect, request.expected_tries, hop, error,
                      &dropped_hostname)) {
      if (logger != nullptr) {
        logger->Error("hop line rejected", {{"code", ToString(error.code)}, {"line", line}});
      }
      return false;
    }
    if (!assembled.hops.empty() && hop.index <= assembled.hops.back().index) {
      if (logger != nullptr) {
        logger->Error("hop index out of order",
                      {{"code", ToString(ProbeErrorCode::kMalformedHopLine)}, {"line", line}});
      }
      return SetProbeError(error, ProbeErrorCode::kMalformedHopLine,
                           "hop index " + std::to_string(hop.index) + " does not follow hop " +
                               std::to_string(assembled.hops.back().index));
    }
    if (!dropped_hostname.empty() && logger != nullptr) {
      logger->Debug("ambiguous hostname dropped", {{"hop", std::to_string(hop.index)},
                                                   {"hostname", dropped_hostname}});
    }
    assembled.hops.push_back(std::move(hop));
  }
  const auto finished = std::chrono::steady_clock::now();
  assembled.duration_seconds = std::chrono::duration<double>(finished - started).count();

  if (logger != nullptr) {
    if (assembled.HasData()) {
      logger->Info("run completed",
                   {{"hops", std::to_string(assembled.hops.size())},
                    {"duration_s", core::FormatShortestDouble(assembled.duration_seconds)}});
    } else {
      logger->Warn("run recorded no hops", {{"banner", assembled.description}});
    }
  }

  run = std::move(assembled);
  return true;
}

} // namespace hopmap::probe
