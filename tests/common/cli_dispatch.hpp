#ifndef HOPMAP_TESTS_COMMON_CLI_DISPATCH_HPP_
#define HOPMAP_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "hopmap/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace hopmap::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return hopmap::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Swaps a standard stream's buffer for the lifetime of the guard so command
// output can be asserted on.
class ScopedStreamCapture {
public:
  explicit ScopedStreamCapture(std::ostream& stream)
      : stream_(stream), previous_(stream.rdbuf(captured_.rdbuf())) {}

  ~ScopedStreamCapture() {
    stream_.rdbuf(previous_);
  }

  ScopedStreamCapture(const ScopedStreamCapture&) = delete;
  ScopedStreamCapture& operator=(const ScopedStreamCapture&) = delete;

  std::string Text() const {
    return captured_.str();
  }

private:
  std::ostream& stream_;
  std::ostringstream captured_;
  std::streambuf* previous_;
};

} // namespace hopmap::tests::common

#endif // HOPMAP_TESTS_COMMON_CLI_DISPATCH_HPP_
