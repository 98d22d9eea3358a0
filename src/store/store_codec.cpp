#include "store/store_codec.hpp"

#include "core/time_utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <system_error>
#include <vector>

namespace hopmap::store {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kNoDataMarker = "No data";

// Older stores wrapped some scalars in a one-element array.
const JsonValue* UnwrapSingleton(const JsonValue* field) {
  if (field != nullptr && field->IsArray() && field->array_value.size() == 1U) {
    return &field->array_value.front();
  }
  return field;
}

bool ParseOptionalStringField(const JsonValue& object, std::string_view key, std::string& value,
                              std::string& error) {
  value.clear();
  const JsonValue* field = UnwrapSingleton(object.Find(key));
  if (field == nullptr) {
    return true;
  }
  if (!field->IsString()) {
    error = "run field '" + std::string(key) + "' must be a string";
    return false;
  }
  value = field->string_value;
  return true;
}

bool ParseRequiredStringField(const JsonValue& object, std::string_view key, std::string& value,
                              std::string& error) {
  if (object.Find(key) == nullptr) {
    error = "run missing required field '" + std::string(key) + "'";
    return false;
  }
  return ParseOptionalStringField(object, key, value, error);
}

bool ParseNonNegativeInteger(const JsonValue& field, std::string_view key, std::uint32_t& value,
                             std::string& error) {
  const double number = field.number_value;
  if (!field.IsNumber() || !std::isfinite(number) || number < 0.0 ||
      std::floor(number) != number ||
      number > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    error = "hop field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint32_t>(number);
  return true;
}

// Finds `-q <n>` in the recorded command line.
std::optional<std::uint32_t> ProbesPerHopFromCommand(std::string_view command_text) {
  std::size_t pos = command_text.find("-q ");
  while (pos != std::string_view::npos) {
    const bool token_start = pos == 0U || command_text[pos - 1U] == ' ';
    if (token_start) {
      std::size_t value_pos = pos + 3U;
      while (value_pos < command_text.size() && command_text[value_pos] == ' ') {
        ++value_pos;
      }
      std::size_t value_end = value_pos;
      while (value_end < command_text.size() && command_text[value_end] != ' ') {
        ++value_end;
      }
      std::uint32_t tries = 0;
      const char* begin = command_text.data() + value_pos;
      const char* end = command_text.data() + value_end;
      const auto [ptr, ec] = std::from_chars(begin, end, tries);
      if (value_end > value_pos && ec == std::errc() && ptr == end) {
        return tries;
      }
    }
    pos = command_text.find("-q ", pos + 1U);
  }
  return std::nullopt;
}

bool HopFromJsonValue(const JsonValue& value, const std::optional<std::uint32_t>& legacy_tries,
                      probe::HopRecord& hop, std::string& error) {
  if (!value.IsObject()) {
    error = "hop entry must be an object";
    return false;
  }

  const JsonValue* index = value.Find("index");
  if (index == nullptr) {
    error = "hop missing required field 'index'";
    return false;
  }
  if (!ParseNonNegativeInteger(*index, "index", hop.index, error)) {
    return false;
  }

  const JsonValue* addresses = value.Find("addresses");
  if (addresses == nullptr) {
    addresses = value.Find("ip_address");
  }
  if (addresses != nullptr) {
    if (!addresses->IsArray()) {
      error = "hop " + std::to_string(hop.index) + " addresses must be an array";
      return false;
    }
    for (const auto& address : addresses->array_value) {
      if (!address.IsString()) {
        error = "hop " + std::to_string(hop.index) + " addresses must hold strings";
        return false;
      }
      hop.addresses.push_back(address.string_value);
    }
  }

  if (const JsonValue* hostname = value.Find("hostname"); hostname != nullptr) {
    if (!hostname->IsString()) {
      error = "hop " + std::to_string(hop.index) + " hostname must be a string";
      return false;
    }
    hop.hostname = hostname->string_value;
  }

  const JsonValue* results = value.Find("results");
  if (results == nullptr || !results->IsArray()) {
    error = "hop " + std::to_string(hop.index) + " results must be an array";
    return false;
  }
  for (const auto& sample : results->array_value) {
    if (!sample.IsNumber()) {
      error = "hop " + std::to_string(hop.index) + " results must hold numbers";
      return false;
    }
    hop.samples.push_back(sample.number_value);
  }

  if (const JsonValue* timeouts = value.Find("timeouts"); timeouts != nullptr) {
    return ParseNonNegativeInteger(*timeouts, "timeouts", hop.timeouts, error);
  }
  if (legacy_tries.has_value() && legacy_tries.value() >= hop.samples.size()) {
    hop.timeouts = legacy_tries.value() - static_cast<std::uint32_t>(hop.samples.size());
  }
  return true;
}

} // namespace

JsonValue RunToJsonValue(const probe::RunResult& run) {
  JsonValue object = JsonValue::MakeObject();
  object.object_value["cmd"] = JsonValue::MakeString(run.command_text);
  object.object_value["description"] = JsonValue::MakeString(run.description);
  object.object_value["timestamp"] = JsonValue::MakeString(core::FormatUtcTimestamp(run.timestamp));
  object.object_value["time_taken_in_secs"] = JsonValue::MakeNumber(run.duration_seconds);

  if (!run.HasData()) {
    object.object_value["data"] = JsonValue::MakeString(std::string(kNoDataMarker));
    return object;
  }

  JsonValue hops = JsonValue::MakeArray();
  hops.array_value.reserve(run.hops.size());
  for (const auto& hop : run.hops) {
    JsonValue entry = JsonValue::MakeObject();
    entry.object_value["index"] = JsonValue::MakeNumber(static_cast<double>(hop.index));
    if (!hop.addresses.empty()) {
      JsonValue addresses = JsonValue::MakeArray();
      for (const auto& address : hop.addresses) {
        addresses.array_value.push_back(JsonValue::MakeString(address));
      }
      entry.object_value["addresses"] = std::move(addresses);
    }
    if (hop.hostname.has_value()) {
      entry.object_value["hostname"] = JsonValue::MakeString(hop.hostname.value());
    }
    JsonValue results = JsonValue::MakeArray();
    for (const double sample : hop.samples) {
      results.array_value.push_back(JsonValue::MakeNumber(sample));
    }
    entry.object_value["results"] = std::move(results);
    entry.object_value["timeouts"] = JsonValue::MakeNumber(static_cast<double>(hop.timeouts));
    hops.array_value.push_back(std::move(entry));
  }
  object.object_value["data"] = std::move(hops);
  return object;
}

JsonValue StoreToJsonValue(const RunStore& store) {
  JsonValue root = JsonValue::MakeObject();
  for (const auto& target : store.Targets()) {
    JsonValue runs = JsonValue::MakeArray();
    for (const auto& run : store.History(target)) {
      runs.array_value.push_back(RunToJsonValue(run));
    }
    root.object_value[target] = std::move(runs);
  }
  return root;
}

std::string SerializeStore(const RunStore& store) {
  return core::json::Serialize(StoreToJsonValue(store), 4) + "\n";
}

bool RunFromJsonValue(const JsonValue& value, std::string_view target, probe::RunResult& run,
                      std::string& error) {
  if (!value.IsObject()) {
    error = "run entry for target '" + std::string(target) + "' must be an object";
    return false;
  }

  probe::RunResult parsed;
  parsed.target = std::string(target);
  if (!ParseRequiredStringField(value, "cmd", parsed.command_text, error) ||
      !ParseOptionalStringField(value, "description", parsed.description, error)) {
    return false;
  }

  std::string timestamp_text;
  if (!ParseRequiredStringField(value, "timestamp", timestamp_text, error)) {
    return false;
  }
  if (!core::ParseUtcTimestamp(timestamp_text, parsed.timestamp, error)) {
    return false;
  }

  if (const JsonValue* duration = UnwrapSingleton(value.Find("time_taken_in_secs"));
      duration != nullptr) {
    if (!duration->IsNumber() || duration->number_value < 0.0) {
      error = "run field 'time_taken_in_secs' must be a non-negative number";
      return false;
    }
    parsed.duration_seconds = duration->number_value;
  }

  // Anything but an array is treated as "no data".
  const JsonValue* data = value.Find("data");
  if (data != nullptr && data->IsArray()) {
    const std::optional<std::uint32_t> legacy_tries =
        ProbesPerHopFromCommand(parsed.command_text);
    parsed.hops.reserve(data->array_value.size());
    for (const auto& hop_value : data->array_value) {
      probe::HopRecord hop;
      if (!HopFromJsonValue(hop_value, legacy_tries, hop, error)) {
        error = "target '" + std::string(target) + "': " + error;
        return false;
      }
      parsed.hops.push_back(std::move(hop));
    }
  }

  run = std::move(parsed);
  return true;
}

bool StoreFromJsonValue(const JsonValue& root, RunStore& store, std::string& error) {
  if (!root.IsObject()) {
    error = "store document must be a JSON object keyed by target";
    return false;
  }

  std::vector<probe::RunResult> loaded;
  for (const auto& [target, runs] : root.object_value) {
    if (!runs.IsArray()) {
      error = "store entry for target '" + target + "' must be an array of runs";
      return false;
    }
    for (const auto& run_value : runs.array_value) {
      probe::RunResult run;
      if (!RunFromJsonValue(run_value, target, run, error)) {
        return false;
      }
      loaded.push_back(std::move(run));
    }
  }

  for (auto& run : loaded) {
    store.Append(std::move(run));
  }
  return true;
}

bool ParseStore(std::string_view text, RunStore& store, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  return StoreFromJsonValue(root, store, error);
}

} // namespace hopmap::store
