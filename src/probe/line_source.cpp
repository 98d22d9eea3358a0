#include "probe/line_source.hpp"

namespace hopmap::probe {

bool StreamLineSource::ReadLine(std::string& line) {
  if (!std::getline(*in_, line)) {
    return false;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

} // namespace hopmap::probe
