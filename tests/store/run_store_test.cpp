#include "store/run_store.hpp"

#include "common/run_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace common = hopmap::tests::common;

TEST_CASE("RunStore keeps per-target append order", "[store]") {
  hopmap::store::RunStore store;
  auto first = common::MakeRun("b.example", {common::MakeHop(1, {"10.0.0.1"}, {1.0, 1.1, 1.2})});
  auto second = common::MakeRun("b.example", {});
  second.duration_seconds = 9.0;
  store.Append(first);
  store.Append(second);
  store.Append(common::MakeRun("a.example", {}));

  REQUIRE(store.Targets() == std::vector<std::string>{"a.example", "b.example"});
  const auto& history = store.History("b.example");
  REQUIRE(history.size() == 2U);
  REQUIRE(history[0] == first);
  REQUIRE(history[1] == second);
}

TEST_CASE("RunStore counts runs with and without data", "[store]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("a.example", {common::MakeHop(1, {"10.0.0.1"}, {1.0, 1.0, 1.0})}),
      common::MakeRun("a.example", {}),
      common::MakeRun("a.example", {common::MakeHop(1, {}, {}, 3)}),
      common::MakeRun("b.example", {}),
  });

  REQUIRE(store.EntryCount("a.example") == 2U);
  REQUIRE(store.EmptyEntryCount("a.example") == 1U);
  REQUIRE(store.EntryCount("b.example") == 0U);
  REQUIRE(store.EmptyEntryCount("b.example") == 1U);
  REQUIRE(store.TotalEntryCount() == 2U);
  REQUIRE(store.TotalEmptyEntryCount() == 2U);
}

TEST_CASE("RunStore answers unknown targets with empty results", "[store]") {
  const hopmap::store::RunStore store{};
  REQUIRE(store.Empty());
  REQUIRE(store.History("nowhere.example").empty());
  REQUIRE_FALSE(store.Contains("nowhere.example"));
  REQUIRE(store.EntryCount("nowhere.example") == 0U);
  REQUIRE(store.Targets().empty());
}
