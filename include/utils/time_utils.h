#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace TimeUtils {

inline std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  struct tm tm_buf;
  std::tm *tm_ptr = localtime_r(&time_t, &tm_buf);
  if (!tm_ptr) {
    return "";
  }
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

bool isValidCalendarDate(int year, int month, int day);

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int year, int month, int day);

// Strict ISO-8601: YYYY-MM-DD, optionally followed by THH:MM[:SS[.fff]] and
// a zone designator (Z or +HH:MM). Returns epoch milliseconds (UTC).
std::optional<int64_t> parseIsoDate(const std::string &value);

// Lenient date recognition for spreadsheet text: ISO forms, YYYY/MM/DD,
// MM/DD/YYYY, DD.MM.YYYY and English month-name forms such as
// "Jan 15, 2024", "15 January 2024" or "Mon, 15 Jan 2024 10:00:00 GMT".
std::optional<int64_t> parseDate(const std::string &value);

std::string formatIsoDate(int64_t epochMillis);

} // namespace TimeUtils

#endif
