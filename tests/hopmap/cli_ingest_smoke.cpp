#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/run_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "hopmap/cli/router.hpp"
#include "store/store_file.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace common = hopmap::tests::common;

namespace {

int Ingest(const fs::path& store_path, const fs::path& input_path,
           const std::vector<std::string>& extra_args = {}) {
  std::vector<std::string> argv = {"hopmap",   "ingest",           store_path.string(),
                                   "--target", "example.com",      "--input",
                                   input_path.string(), "--cmd", "traceroute -q 3 example.com"};
  argv.insert(argv.end(), extra_args.begin(), extra_args.end());
  return common::DispatchArgs(argv);
}

std::size_t HistorySize(const fs::path& store_path) {
  hopmap::store::RunStore store;
  std::string error;
  if (!hopmap::store::LoadStoreFile(store_path, store, error)) {
    common::Fail("store reload failed: " + error);
  }
  return store.History("example.com").size();
}

} // namespace

int main() {
  const common::ScopedTempDir temp_dir("hopmap-cli-ingest-smoke");
  const fs::path& temp_root = temp_dir.Path();
  const fs::path store_path = temp_root / "results.json";

  const fs::path modern_input = temp_root / "modern.txt";
  common::WriteFixtureFile(modern_input, common::kModernTranscript);
  const fs::path inetutils_input = temp_root / "inetutils.txt";
  common::WriteFixtureFile(inetutils_input, common::kInetutilsTranscript);

  {
    common::ScopedStreamCapture out(std::cout);
    common::ScopedStreamCapture err(std::cerr);
    common::AssertEq(Ingest(store_path, modern_input, {"--log-level", "debug"}), 0,
                     "modern ingest");
    common::AssertContains(out.Text(), "hops: 3");
    common::AssertContains(err.Text(), "msg=\"run appended to store\"");
    common::AssertContains(err.Text(), "msg=\"ambiguous hostname dropped\"");
  }
  {
    common::ScopedStreamCapture out(std::cout);
    common::AssertEq(Ingest(store_path, inetutils_input, {"--dialect", "inetutils"}), 0,
                     "inetutils ingest");
  }
  common::AssertEq(static_cast<long long>(HistorySize(store_path)), 2, "history after ingest");

  // Ingest through the in-process entry point.
  {
    common::ScopedStreamCapture out(std::cout);
    common::ScopedStreamCapture err(std::cerr);
    hopmap::cli::IngestOptions options;
    options.store_path = store_path;
    options.target = "example.com";
    std::istringstream input{"traceroute to example.com (93.184.216.34), 30 hops max\n"};
    common::AssertEq(hopmap::cli::ExecuteIngest(options, input), 0, "no-data ingest");
    common::AssertContains(err.Text(), "msg=\"run recorded no hops\"");
  }
  common::AssertEq(static_cast<long long>(HistorySize(store_path)), 3, "history after no-data");

  struct RejectedCase {
    std::string name;
    std::string transcript;
    std::vector<std::string> extra_args;
    int expected_exit;
  };
  const std::vector<RejectedCase> rejected = {
      {"unresolved", std::string(common::kUnresolvedTranscript), {}, 30},
      {"invalid_argument", "banner\nsendto: Invalid argument\n", {}, 21},
      {"count_mismatch", "banner\n 1  (10.0.0.1)  1 ms  *\n", {}, 20},
      {"malformed", "banner\n one  * * *\n", {}, 20},
      {"tries_mismatch", std::string(common::kModernTranscript), {"--tries", "2"}, 20},
      {"unknown_dialect", std::string(common::kModernTranscript), {"--dialect", "bsd"}, 40},
  };
  for (const auto& rejected_case : rejected) {
    const fs::path input = temp_root / (rejected_case.name + ".txt");
    common::WriteFixtureFile(input, rejected_case.transcript);
    common::ScopedStreamCapture err(std::cerr);
    common::AssertEq(Ingest(store_path, input, rejected_case.extra_args),
                     rejected_case.expected_exit, rejected_case.name);
  }
  // Rejected runs never reach the store.
  common::AssertEq(static_cast<long long>(HistorySize(store_path)), 3, "history after rejects");

  // Usage errors.
  {
    common::ScopedStreamCapture err(std::cerr);
    common::AssertEq(common::DispatchArgs({"hopmap", "ingest", store_path.string()}), 2,
                     "missing target");
    common::AssertEq(Ingest(store_path, modern_input, {"--tries", "0"}), 2, "zero tries");
    common::AssertEq(Ingest(store_path, modern_input, {"--bogus"}), 2, "unknown flag");
    common::AssertEq(Ingest(store_path, modern_input, {"--log-level", "loud"}), 2,
                     "bad log level");
    common::AssertEq(common::DispatchArgs({"hopmap", "frobnicate"}), 2, "unknown command");
    common::AssertEq(common::DispatchArgs({"hopmap"}), 2, "no command");
  }

  // Configuration is checked once per ingest, before the transcript is opened.
  {
    common::ScopedStreamCapture out(std::cout);
    common::ScopedStreamCapture err(std::cerr);
    common::AssertEq(Ingest(store_path, modern_input, {"--log-level", "debug"}), 0,
                     "debug ingest");
    const std::string logs = err.Text();
    const std::string accepted = "msg=\"probe configuration accepted\"";
    common::AssertContains(logs, accepted);
    if (logs.find(accepted) != logs.rfind(accepted)) {
      common::Fail("ingest configuration validated more than once:\n" + logs);
    }

    common::AssertEq(Ingest(store_path, temp_root / "absent.txt", {"--dialect", "bsd"}), 40,
                     "dialect checked before input");
  }

  // Missing transcript file and a corrupt store.
  {
    common::ScopedStreamCapture err(std::cerr);
    common::AssertEq(Ingest(store_path, temp_root / "absent.txt"), 1, "missing input");

    const fs::path corrupt_store = temp_root / "corrupt.json";
    common::WriteFixtureFile(corrupt_store, "not json");
    common::AssertEq(Ingest(corrupt_store, modern_input), 10, "corrupt store");
    common::AssertContains(common::ReadFileToString(corrupt_store), "not json");
  }

  {
    common::ScopedStreamCapture out(std::cout);
    common::AssertEq(common::DispatchArgs({"hopmap", "version"}), 0, "version");
    common::AssertContains(out.Text(), "hopmap ");
  }

  std::cout << "cli_ingest_smoke: ok\n";
  return 0;
}
