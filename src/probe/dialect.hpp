#pragma once

#include "probe/probe_error.hpp"

#include <string>
#include <string_view>

namespace hopmap::probe {

// Output flavours of the traceroute tool.
//
// - kModern (Linux traceroute 2.x): `host (1.2.3.4)  0.512 ms`, the address
//   is parenthesized and times are bare numbers followed by a separate `ms`.
// - kInetutils (GNU inetutils): `1.2.3.4 (host)  0.512ms`, the name is
//   parenthesized and the unit is glued to the number.
enum class Dialect {
  kModern,
  kInetutils,
};

enum class TokenKind {
  kTimeout,
  kAddress,
  kTime,
  kName,
  kIgnored,
};

// Result of classifying one whitespace-delimited token.
//
// `text` is the token with wrapping parentheses removed for address and name
// tokens, and the raw token otherwise. `time_ms` is meaningful only for
// kTime.
struct ClassifiedToken {
  TokenKind kind = TokenKind::kIgnored;
  std::string text;
  double time_ms = 0.0;
};

const char* ToString(Dialect dialect);
const char* ToString(TokenKind kind);

// Resolves a dialect from a short name (`modern`, `inetutils`, `a`, `b`,
// any case) or from the exact first line printed by `traceroute --version`.
// Fails with kUnknownDialect otherwise.
bool ParseDialect(std::string_view text, Dialect& dialect, ProbeError& error);

// True for four dot-separated decimal octets, each in [0,255].
bool IsIpv4Literal(std::string_view token);

// Total classification: every token maps to exactly one TokenKind. Checks run
// in the fixed order timeout, address, time, name; whatever is left is
// kIgnored.
ClassifiedToken ClassifyToken(Dialect dialect, std::string_view token);

} // namespace hopmap::probe
