#pragma once

#include "probe/run_result.hpp"
#include "store/run_store.hpp"

#include <filesystem>
#include <string>

namespace hopmap::store {

// Why a store file operation failed. kFormat means the file was readable but
// is not a store document; everything else is kIo.
enum class StoreFileFailure {
  kNone,
  kIo,
  kFormat,
};

// Loads a store file into `store`. A missing file is an empty store.
bool LoadStoreFile(const std::filesystem::path& path, RunStore& store, std::string& error,
                   StoreFileFailure* failure = nullptr);

// Replaces the file with the serialized `store` (atomic temp-file + rename).
bool SaveStoreFile(const std::filesystem::path& path, const RunStore& store, std::string& error);

// Appends one run under `run.target` with a read-modify-write of the file.
//
// Existing run objects are carried over from the parsed JSON document as they
// are, so runs written by older tools keep every field they had. The
// read-modify-write is not serialized: concurrent appenders to the same file
// must hold their own lock or one of the appended runs may be lost.
bool AppendRunToStoreFile(const std::filesystem::path& path, const probe::RunResult& run,
                          std::string& error, StoreFileFailure* failure = nullptr);

} // namespace hopmap::store
