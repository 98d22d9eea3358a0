#ifndef HOPMAP_CORE_TIME_UTILS_HPP_
#define HOPMAP_CORE_TIME_UTILS_HPP_

#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace hopmap::core {

// Canonical UTC timestamp formatter used by the store writer and the logger.
// Millisecond precision matches what the store keeps for each run.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(
      std::chrono::floor<std::chrono::seconds>(timestamp));
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

namespace detail {

inline bool ParseFixedDigits(std::string_view text, std::size_t pos, std::size_t width,
                             int& value) {
  if (pos + width > text.size()) {
    return false;
  }
  const char* begin = text.data() + pos;
  const char* end = begin + width;
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

} // namespace detail

// Parses `YYYY-MM-DDTHH:MM:SS[.fff...][Z]` and the space-separated variant
// `YYYY-MM-DD HH:MM:SS[.ffffff]` older stores carry. Both are read as UTC.
// Fractions finer than a millisecond are truncated.
inline bool ParseUtcTimestamp(std::string_view text,
                              std::chrono::system_clock::time_point& timestamp,
                              std::string& error) {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  const bool shape_ok = text.size() >= 19U && text[4] == '-' && text[7] == '-' &&
                        (text[10] == 'T' || text[10] == ' ') && text[13] == ':' &&
                        text[16] == ':';
  if (!shape_ok || !detail::ParseFixedDigits(text, 0, 4, year) ||
      !detail::ParseFixedDigits(text, 5, 2, month) || !detail::ParseFixedDigits(text, 8, 2, day) ||
      !detail::ParseFixedDigits(text, 11, 2, hour) ||
      !detail::ParseFixedDigits(text, 14, 2, minute) ||
      !detail::ParseFixedDigits(text, 17, 2, second)) {
    error = "invalid timestamp '" + std::string(text) + "'";
    return false;
  }

  std::size_t pos = 19;
  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int scale = 100;
    const std::size_t digits_start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
    if (pos == digits_start) {
      error = "invalid timestamp fraction in '" + std::string(text) + "'";
      return false;
    }
  }
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    error = "unexpected trailing characters in timestamp '" + std::string(text) + "'";
    return false;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
    error = "timestamp out of range '" + std::string(text) + "'";
    return false;
  }

  timestamp = std::chrono::sys_days{ymd} + std::chrono::hours(hour) +
              std::chrono::minutes(minute) + std::chrono::seconds(second) +
              std::chrono::milliseconds(millis);
  return true;
}

} // namespace hopmap::core

#endif // HOPMAP_CORE_TIME_UTILS_HPP_
