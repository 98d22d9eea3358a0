#include "store/store_file.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "store/store_codec.hpp"

namespace fs = std::filesystem;

namespace hopmap::store {

namespace {

using JsonValue = core::json::Value;

bool Fail(StoreFileFailure kind, StoreFileFailure* failure) {
  if (failure != nullptr) {
    *failure = kind;
  }
  return false;
}

// Reads and parses the store document; a missing file yields an empty object.
bool ReadStoreDocument(const fs::path& path, JsonValue& root, std::string& error,
                       StoreFileFailure* failure) {
  std::string contents;
  bool exists = false;
  if (!core::ReadTextFile(path, true, contents, exists, error)) {
    return Fail(StoreFileFailure::kIo, failure);
  }
  if (!exists) {
    root = JsonValue::MakeObject();
    return true;
  }

  if (!core::json::Parse(contents, root, error)) {
    error = "store file '" + path.string() + "' is not valid JSON: " + error;
    return Fail(StoreFileFailure::kFormat, failure);
  }
  if (!root.IsObject()) {
    error = "store file '" + path.string() + "' must hold a JSON object keyed by target";
    return Fail(StoreFileFailure::kFormat, failure);
  }
  return true;
}

} // namespace

bool LoadStoreFile(const fs::path& path, RunStore& store, std::string& error,
                   StoreFileFailure* failure) {
  JsonValue root;
  if (!ReadStoreDocument(path, root, error, failure)) {
    return false;
  }
  if (!StoreFromJsonValue(root, store, error)) {
    error = "store file '" + path.string() + "': " + error;
    return Fail(StoreFileFailure::kFormat, failure);
  }
  return true;
}

bool SaveStoreFile(const fs::path& path, const RunStore& store, std::string& error) {
  return core::WriteTextFileAtomic(path, SerializeStore(store), error);
}

bool AppendRunToStoreFile(const fs::path& path, const probe::RunResult& run, std::string& error,
                          StoreFileFailure* failure) {
  JsonValue root;
  if (!ReadStoreDocument(path, root, error, failure)) {
    return false;
  }

  JsonValue& runs = root.object_value[run.target];
  if (runs.type == JsonValue::Type::kNull) {
    runs = JsonValue::MakeArray();
  }
  if (!runs.IsArray()) {
    error = "store entry for target '" + run.target + "' must be an array of runs";
    return Fail(StoreFileFailure::kFormat, failure);
  }
  runs.array_value.push_back(RunToJsonValue(run));

  if (!core::WriteTextFileAtomic(path, core::json::Serialize(root, 4) + "\n", error)) {
    return Fail(StoreFileFailure::kIo, failure);
  }
  return true;
}

} // namespace hopmap::store
