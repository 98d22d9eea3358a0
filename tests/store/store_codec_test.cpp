#include "store/store_codec.hpp"

#include "common/run_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace common = hopmap::tests::common;

namespace {

void RequireContains(const std::string& text, const std::string& needle) {
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("Store document round-trips runs exactly", "[store][codec]") {
  auto with_data = common::MakeRun(
      "example.com",
      {
          common::MakeHop(1, {"192.168.1.1"}, {0.512, 0.498, 0.471}, 0, "gateway"),
          common::MakeHop(2, {}, {}, 3),
          common::MakeHop(3, {"93.184.216.34", "93.184.216.35"}, {11.2, 12.0}, 1),
      });
  with_data.duration_seconds = 3.0170000000000003;
  auto no_data = common::MakeRun("example.com", {});
  no_data.description.clear();

  const hopmap::store::RunStore original = common::MakeStore({with_data, no_data});
  const std::string text = hopmap::store::SerializeStore(original);

  hopmap::store::RunStore reloaded;
  std::string error;
  REQUIRE(hopmap::store::ParseStore(text, reloaded, error));
  REQUIRE(reloaded.History("example.com") == original.History("example.com"));
}

TEST_CASE("Store writer emits the persisted field names", "[store][codec]") {
  const hopmap::store::RunStore store = common::MakeStore({
      common::MakeRun("example.com", {common::MakeHop(1, {"10.0.0.1"}, {1.5, 2.0, 2.5})}),
      common::MakeRun("example.com", {}),
  });
  const std::string text = hopmap::store::SerializeStore(store);

  RequireContains(text, "\"example.com\": [");
  RequireContains(text, "\"cmd\": \"traceroute -q 3 example.com\"");
  RequireContains(text, "\"timestamp\": \"2024-03-14T09:26:00.535Z\"");
  RequireContains(text, "\"time_taken_in_secs\": 1.25");
  RequireContains(text, "\"addresses\": [\n");
  RequireContains(text, "\"results\": [\n");
  RequireContains(text, "\"timeouts\": 0");
  RequireContains(text, "\"data\": \"No data\"");
  REQUIRE(text.back() == '\n');
}

TEST_CASE("Legacy store files load", "[store][codec]") {
  const std::string legacy = R"({
    "example.com": [
        {
            "cmd": "traceroute -q 3 example.com",
            "data": [
                {"index": 1, "ip_address": ["192.168.1.1"], "hostname": "gateway", "results": [0.5, 0.6, 0.7]},
                {"index": 2, "results": []},
                {"index": 3, "ip_address": ["93.184.216.34"], "results": [11.2]}
            ],
            "description": ["traceroute to example.com (93.184.216.34), 30 hops max, 60 byte packets"],
            "time_taken_in_secs": [4.21],
            "timestamp": ["2019-05-02 18:04:11.582731"]
        },
        {
            "cmd": "traceroute -q 3 example.com",
            "data": "No data",
            "timestamp": "2019-05-02 18:10:00.000001"
        }
    ]
})";

  hopmap::store::RunStore store;
  std::string error;
  REQUIRE(hopmap::store::ParseStore(legacy, store, error));

  const auto& history = store.History("example.com");
  REQUIRE(history.size() == 2U);

  const auto& run = history[0];
  REQUIRE(run.target == "example.com");
  REQUIRE(run.description ==
          "traceroute to example.com (93.184.216.34), 30 hops max, 60 byte packets");
  REQUIRE(run.duration_seconds == 4.21);
  REQUIRE(run.timestamp == std::chrono::system_clock::time_point(
                               std::chrono::sys_days{std::chrono::year{2019} / 5 / 2} +
                               std::chrono::hours{18} + std::chrono::minutes{4} +
                               std::chrono::seconds{11} + std::chrono::milliseconds{582}));
  REQUIRE(run.hops.size() == 3U);
  REQUIRE(run.hops[0].addresses == std::vector<std::string>{"192.168.1.1"});
  REQUIRE(run.hops[0].hostname == std::optional<std::string>("gateway"));
  REQUIRE(run.hops[0].timeouts == 0U);
  REQUIRE(run.hops[1].addresses.empty());
  REQUIRE(run.hops[1].timeouts == 3U);
  REQUIRE(run.hops[2].timeouts == 2U);

  REQUIRE_FALSE(history[1].HasData());
  REQUIRE(history[1].description.empty());
}

TEST_CASE("Missing timeouts default to zero without a probe count", "[store][codec]") {
  const std::string text = R"({"example.com": [{"cmd": "traceroute example.com",
      "timestamp": "2024-01-01T00:00:00.000Z",
      "data": [{"index": 1, "results": [1.0]}]}]})";

  hopmap::store::RunStore store;
  std::string error;
  REQUIRE(hopmap::store::ParseStore(text, store, error));
  REQUIRE(store.History("example.com").front().hops.front().timeouts == 0U);
}

TEST_CASE("Malformed store documents are rejected without partial loads", "[store][codec]") {
  hopmap::store::RunStore store;
  std::string error;

  REQUIRE_FALSE(hopmap::store::ParseStore("[]", store, error));
  RequireContains(error, "JSON object");

  error.clear();
  REQUIRE_FALSE(hopmap::store::ParseStore(R"({"a": [{"timestamp": "2024-01-01T00:00:00Z"}]})",
                                          store, error));
  RequireContains(error, "cmd");

  error.clear();
  REQUIRE_FALSE(hopmap::store::ParseStore(
      R"({"a": [{"cmd": "x", "timestamp": "2024-01-01T00:00:00Z", "data": []}],
          "b": [{"cmd": "x", "timestamp": "not a time"}]})",
      store, error));
  RequireContains(error, "timestamp");
  REQUIRE(store.Empty());
}
