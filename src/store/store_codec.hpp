#pragma once

#include "core/json_dom.hpp"
#include "probe/run_result.hpp"
#include "store/run_store.hpp"

#include <string>
#include <string_view>

namespace hopmap::store {

// JSON mapping of the persisted store:
//
//   { "<target>": [ <run>, ... ], ... }
//
// A run with hops is
//   {"cmd", "description", "timestamp", "time_taken_in_secs",
//    "data": [{"index", "addresses"?, "hostname"?, "results", "timeouts"}]}
// and a run without hops carries `"data": "No data"` in place of the array.
//
// The reader also accepts legacy store files from earlier wrapper scripts:
// `ip_address` for `addresses`, one-element arrays around `description`,
// `timestamp` and `time_taken_in_secs`, space-separated timestamps, and hop
// objects without `timeouts` (inferred from `-q <n>` in `cmd`).

core::json::Value RunToJsonValue(const probe::RunResult& run);
core::json::Value StoreToJsonValue(const RunStore& store);

// Pretty-printed (4-space indent, sorted keys) store document.
std::string SerializeStore(const RunStore& store);

// `target` is the key the run was filed under; the run object does not repeat
// it.
bool RunFromJsonValue(const core::json::Value& value, std::string_view target,
                      probe::RunResult& run, std::string& error);

// Appends every run found in `root` to `store`, target by target.
bool StoreFromJsonValue(const core::json::Value& root, RunStore& store, std::string& error);

bool ParseStore(std::string_view text, RunStore& store, std::string& error);

} // namespace hopmap::store
