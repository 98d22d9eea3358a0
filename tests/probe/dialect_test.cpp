#include "probe/dialect.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string_view>

namespace {

using hopmap::probe::ClassifyToken;
using hopmap::probe::Dialect;
using hopmap::probe::TokenKind;

TokenKind KindOf(Dialect dialect, std::string_view token) {
  return ClassifyToken(dialect, token).kind;
}

} // namespace

TEST_CASE("Dialect names and version banners resolve", "[probe][dialect]") {
  Dialect dialect = Dialect::kInetutils;
  hopmap::probe::ProbeError error;

  REQUIRE(hopmap::probe::ParseDialect("modern", dialect, error));
  REQUIRE(dialect == Dialect::kModern);
  REQUIRE(hopmap::probe::ParseDialect("B", dialect, error));
  REQUIRE(dialect == Dialect::kInetutils);
  REQUIRE(hopmap::probe::ParseDialect("Modern traceroute for Linux, version 2.1.0", dialect,
                                      error));
  REQUIRE(dialect == Dialect::kModern);
  REQUIRE(hopmap::probe::ParseDialect("traceroute (GNU inetutils) 1.9.4", dialect, error));
  REQUIRE(dialect == Dialect::kInetutils);
}

TEST_CASE("Unknown dialect fails with a typed error", "[probe][dialect]") {
  Dialect dialect = Dialect::kModern;
  hopmap::probe::ProbeError error;

  REQUIRE_FALSE(hopmap::probe::ParseDialect("tracert", dialect, error));
  REQUIRE(error.code == hopmap::probe::ProbeErrorCode::kUnknownDialect);
  REQUIRE(error.message.find("tracert") != std::string::npos);

  // Only the exact banners are accepted; a newer release is not guessed at.
  error = {};
  REQUIRE_FALSE(hopmap::probe::ParseDialect("traceroute (GNU inetutils) 2.0", dialect, error));
  REQUIRE(error.code == hopmap::probe::ProbeErrorCode::kUnknownDialect);
}

TEST_CASE("IPv4 literal check enforces octet ranges", "[probe][dialect]") {
  REQUIRE(hopmap::probe::IsIpv4Literal("0.0.0.0"));
  REQUIRE(hopmap::probe::IsIpv4Literal("255.255.255.255"));
  REQUIRE_FALSE(hopmap::probe::IsIpv4Literal("256.1.1.1"));
  REQUIRE_FALSE(hopmap::probe::IsIpv4Literal("1.2.3"));
  REQUIRE_FALSE(hopmap::probe::IsIpv4Literal("1.2.3.4.5"));
  REQUIRE_FALSE(hopmap::probe::IsIpv4Literal("1..3.4"));
  REQUIRE_FALSE(hopmap::probe::IsIpv4Literal("a.b.c.d"));
  REQUIRE_FALSE(hopmap::probe::IsIpv4Literal("1.2.3.4x"));
}

TEST_CASE("Modern dialect classifies address-in-parens output", "[probe][dialect]") {
  const auto address = ClassifyToken(Dialect::kModern, "(192.0.2.1)");
  REQUIRE(address.kind == TokenKind::kAddress);
  REQUIRE(address.text == "192.0.2.1");

  const auto time = ClassifyToken(Dialect::kModern, "11.25");
  REQUIRE(time.kind == TokenKind::kTime);
  REQUIRE(time.time_ms == 11.25);

  REQUIRE(KindOf(Dialect::kModern, "*") == TokenKind::kTimeout);
  REQUIRE(KindOf(Dialect::kModern, "ms") == TokenKind::kIgnored);
  REQUIRE(KindOf(Dialect::kModern, "router.example.net") == TokenKind::kName);
  // A bare address is a printed name in this dialect.
  REQUIRE(KindOf(Dialect::kModern, "192.0.2.1") == TokenKind::kName);
  REQUIRE(KindOf(Dialect::kModern, "(not-an-ip)") == TokenKind::kName);
}

TEST_CASE("Inetutils dialect classifies name-in-parens output", "[probe][dialect]") {
  const auto address = ClassifyToken(Dialect::kInetutils, "192.0.2.1");
  REQUIRE(address.kind == TokenKind::kAddress);
  REQUIRE(address.text == "192.0.2.1");

  const auto time = ClassifyToken(Dialect::kInetutils, "0.512ms");
  REQUIRE(time.kind == TokenKind::kTime);
  REQUIRE(time.time_ms == 0.512);

  const auto name = ClassifyToken(Dialect::kInetutils, "(gateway)");
  REQUIRE(name.kind == TokenKind::kName);
  REQUIRE(name.text == "gateway");

  REQUIRE(KindOf(Dialect::kInetutils, "*") == TokenKind::kTimeout);
  REQUIRE(KindOf(Dialect::kInetutils, "(192.0.2.1)") == TokenKind::kIgnored);
  REQUIRE(KindOf(Dialect::kInetutils, "0.512") == TokenKind::kIgnored);
  REQUIRE(KindOf(Dialect::kInetutils, "ms") == TokenKind::kIgnored);
  REQUIRE(KindOf(Dialect::kInetutils, "gateway") == TokenKind::kIgnored);
}
