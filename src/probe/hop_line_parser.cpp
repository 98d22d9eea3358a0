#include "probe/hop_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>
#include <vector>

namespace hopmap::probe {

namespace {

std::vector<std::string_view> SplitWhitespace(std::string_view line) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(line.substr(start, pos - start));
    }
  }
  return tokens;
}

bool ParseHopIndex(std::string_view token, std::uint32_t& index) {
  if (token.empty() || std::isdigit(static_cast<unsigned char>(token.front())) == 0) {
    return false;
  }
  const char* end = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), end, index);
  return ec == std::errc() && ptr == end;
}

} // namespace

bool ParseHopLine(std::string_view line, const Dialect dialect,
                  const std::uint32_t expected_tries, HopRecord& hop, ProbeError& error,
                  std::string* dropped_hostname) {
  const std::vector<std::string_view> tokens = SplitWhitespace(line);
  if (tokens.empty()) {
    return SetProbeError(error, ProbeErrorCode::kMalformedHopLine,
                         "hop line is empty, expected a hop index");
  }

  HopRecord parsed;
  if (!ParseHopIndex(tokens.front(), parsed.index)) {
    return SetProbeError(error, ProbeErrorCode::kMalformedHopLine,
                         "hop line does not start with a hop index: '" + std::string(line) +
                             "'");
  }

  std::int64_t remaining = expected_tries;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    ClassifiedToken token = ClassifyToken(dialect, tokens[i]);
    switch (token.kind) {
    case TokenKind::kTimeout:
      ++parsed.timeouts;
      --remaining;
      break;
    case TokenKind::kAddress:
      if (std::find(parsed.addresses.begin(), parsed.addresses.end(), token.text) ==
          parsed.addresses.end()) {
        parsed.addresses.push_back(std::move(token.text));
      }
      break;
    case TokenKind::kTime:
      parsed.samples.push_back(token.time_ms);
      --remaining;
      break;
    case TokenKind::kName:
      parsed.hostname = std::move(token.text);
      break;
    case TokenKind::kIgnored:
      break;
    }
  }

  if (parsed.hostname.has_value() && !parsed.addresses.empty()) {
    const bool ambiguous = parsed.addresses.size() > 1U;
    const bool redundant = !ambiguous && parsed.addresses.front() == parsed.hostname.value();
    if (ambiguous || redundant) {
      if (dropped_hostname != nullptr) {
        *dropped_hostname = parsed.hostname.value();
      }
      parsed.hostname.reset();
    }
  }

  if (remaining != 0) {
    return SetProbeError(
        error, ProbeErrorCode::kProbeCountMismatch,
        "hop " + std::to_string(parsed.index) + " accounts for " +
            std::to_string(static_cast<std::int64_t>(expected_tries) - remaining) +
            " probes, expected " + std::to_string(expected_tries) + ": '" + std::string(line) +
            "'");
  }

  hop = std::move(parsed);
  return true;
}

} // namespace hopmap::probe
