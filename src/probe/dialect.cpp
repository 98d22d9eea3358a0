#include "probe/dialect.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace hopmap::probe {

namespace {

constexpr std::string_view kModernVersionBanner = "Modern traceroute for Linux, version 2.1.0";
constexpr std::string_view kInetutilsVersionBanner = "traceroute (GNU inetutils) 1.9.4";

std::string ToLowerAscii(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

bool IsWrappedInParens(std::string_view token) {
  return token.size() >= 2U && token.front() == '(' && token.back() == ')';
}

std::string_view StripParens(std::string_view token) {
  return token.substr(1, token.size() - 2U);
}

// Digits with at most one decimal point and at least one digit.
bool IsDecimalNumber(std::string_view token) {
  bool seen_digit = false;
  bool seen_point = false;
  for (const char c : token) {
    if (c == '.') {
      if (seen_point) {
        return false;
      }
      seen_point = true;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    seen_digit = true;
  }
  return seen_digit;
}

bool ParseDecimal(std::string_view token, double& value) {
  if (!IsDecimalNumber(token)) {
    return false;
  }
  const char* begin = token.data();
  const char* end = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

ClassifiedToken Make(TokenKind kind, std::string_view text, double time_ms = 0.0) {
  ClassifiedToken token;
  token.kind = kind;
  token.text = std::string(text);
  token.time_ms = time_ms;
  return token;
}

ClassifiedToken ClassifyModern(std::string_view token) {
  if (IsWrappedInParens(token) && IsIpv4Literal(StripParens(token))) {
    return Make(TokenKind::kAddress, StripParens(token));
  }
  double time_ms = 0.0;
  if (ParseDecimal(token, time_ms)) {
    return Make(TokenKind::kTime, token, time_ms);
  }
  if (token != "ms") {
    return Make(TokenKind::kName, token);
  }
  return Make(TokenKind::kIgnored, token);
}

ClassifiedToken ClassifyInetutils(std::string_view token) {
  if (IsIpv4Literal(token)) {
    return Make(TokenKind::kAddress, token);
  }
  double time_ms = 0.0;
  if (token.size() > 2U && token.substr(token.size() - 2U) == "ms" &&
      ParseDecimal(token.substr(0, token.size() - 2U), time_ms)) {
    return Make(TokenKind::kTime, token, time_ms);
  }
  if (IsWrappedInParens(token) && !IsIpv4Literal(StripParens(token))) {
    return Make(TokenKind::kName, StripParens(token));
  }
  return Make(TokenKind::kIgnored, token);
}

} // namespace

const char* ToString(Dialect dialect) {
  switch (dialect) {
  case Dialect::kModern:
    return "modern";
  case Dialect::kInetutils:
    return "inetutils";
  }
  return "modern";
}

const char* ToString(TokenKind kind) {
  switch (kind) {
  case TokenKind::kTimeout:
    return "timeout";
  case TokenKind::kAddress:
    return "address";
  case TokenKind::kTime:
    return "time";
  case TokenKind::kName:
    return "name";
  case TokenKind::kIgnored:
    return "ignored";
  }
  return "ignored";
}

bool ParseDialect(std::string_view text, Dialect& dialect, ProbeError& error) {
  if (text == kModernVersionBanner) {
    dialect = Dialect::kModern;
    return true;
  }
  if (text == kInetutilsVersionBanner) {
    dialect = Dialect::kInetutils;
    return true;
  }

  const std::string normalized = ToLowerAscii(text);
  if (normalized == "modern" || normalized == "a") {
    dialect = Dialect::kModern;
    return true;
  }
  if (normalized == "inetutils" || normalized == "b") {
    dialect = Dialect::kInetutils;
    return true;
  }

  return SetProbeError(error, ProbeErrorCode::kUnknownDialect,
                       "unknown traceroute dialect '" + std::string(text) +
                           "' (expected modern|inetutils or a supported version banner)");
}

bool IsIpv4Literal(std::string_view token) {
  if (std::count(token.begin(), token.end(), '.') != 3) {
    return false;
  }

  std::size_t start = 0;
  for (int octet_index = 0; octet_index < 4; ++octet_index) {
    const std::size_t dot = token.find('.', start);
    const std::string_view octet =
        token.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (octet.empty() || octet.size() > 3U) {
      return false;
    }
    int value = 0;
    const auto [ptr, ec] = std::from_chars(octet.data(), octet.data() + octet.size(), value);
    if (ec != std::errc() || ptr != octet.data() + octet.size() || value < 0 || value > 255) {
      return false;
    }
    start = dot + 1U;
  }
  return true;
}

ClassifiedToken ClassifyToken(const Dialect dialect, std::string_view token) {
  if (token == "*") {
    return Make(TokenKind::kTimeout, token);
  }

  switch (dialect) {
  case Dialect::kModern:
    return ClassifyModern(token);
  case Dialect::kInetutils:
    return ClassifyInetutils(token);
  }
  return Make(TokenKind::kIgnored, token);
}

} // namespace hopmap::probe
