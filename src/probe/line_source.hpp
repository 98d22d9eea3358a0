#pragma once

#include <istream>
#include <string>

namespace hopmap::probe {

// Sequential provider of decoded probe-tool output lines.
//
// Implementations may block until a line is available. Returning false means
// the stream ended; `line` is then unspecified.
class ILineSource {
public:
  virtual ~ILineSource() = default;

  virtual bool ReadLine(std::string& line) = 0;
};

// Line source over any input stream (stdin, a captured transcript file, or a
// string stream in tests). Line terminators, including a trailing '\r', are
// not part of the returned line.
class StreamLineSource final : public ILineSource {
public:
  explicit StreamLineSource(std::istream& in) : in_(&in) {}

  bool ReadLine(std::string& line) override;

private:
  std::istream* in_;
};

} // namespace hopmap::probe
