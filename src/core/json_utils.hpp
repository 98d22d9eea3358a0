#ifndef HOPMAP_CORE_JSON_UTILS_HPP_
#define HOPMAP_CORE_JSON_UTILS_HPP_

#include <charconv>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace hopmap::core {

// Shared JSON string escaping for the store writer and report exports.
// Keeping one implementation avoids subtle formatting drift across outputs.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Fixed-point rendering for human-facing report columns.
inline std::string FormatFixedDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

// Shortest text that parses back to exactly `value`. Latency samples are
// stored this way so a store survives any number of load/save cycles.
inline std::string FormatShortestDouble(double value) {
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return FormatFixedDouble(value, 6);
  }
  return std::string(buffer, ptr);
}

} // namespace hopmap::core

#endif // HOPMAP_CORE_JSON_UTILS_HPP_
