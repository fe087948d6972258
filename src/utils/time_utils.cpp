#include "utils/time_utils.h"
#include "utils/string_utils.h"
#include <array>
#include <regex>

namespace TimeUtils {

namespace {

const std::array<const char *, 12> MONTH_NAMES = {
    "january", "february", "march",     "april",   "may",      "june",
    "july",    "august",   "september", "october", "november", "december"};

// Resolves "Jan", "january", "Sept" and similar to 1-12, or 0 when the word
// is not a month name.
int monthFromName(const std::string &name) {
  std::string lower = StringUtils::toLower(name);
  if (lower.size() < 3) {
    return 0;
  }
  for (size_t i = 0; i < MONTH_NAMES.size(); ++i) {
    if (StringUtils::startsWith(MONTH_NAMES[i], lower)) {
      return static_cast<int>(i) + 1;
    }
  }
  return 0;
}

bool isValidTime(int hour, int minute, int second) {
  return hour >= 0 && hour < 24 && minute >= 0 && minute < 60 && second >= 0 &&
         second < 60;
}

std::optional<int64_t> toEpochMillis(int year, int month, int day, int hour,
                                     int minute, int second, int millis,
                                     int offsetMinutes) {
  if (!isValidCalendarDate(year, month, day) ||
      !isValidTime(hour, minute, second)) {
    return std::nullopt;
  }
  int64_t days = daysFromCivil(year, month, day);
  int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second -
                    static_cast<int64_t>(offsetMinutes) * 60;
  return seconds * 1000 + millis;
}

int toInt(const std::ssub_match &m, int fallback = 0) {
  return m.matched ? std::stoi(m.str()) : fallback;
}

int parseFraction(const std::ssub_match &m) {
  if (!m.matched) {
    return 0;
  }
  std::string digits = m.str().substr(0, 3);
  while (digits.size() < 3) {
    digits += '0';
  }
  return std::stoi(digits);
}

int parseOffset(const std::ssub_match &m) {
  if (!m.matched) {
    return 0;
  }
  std::string zone = m.str();
  if (zone == "Z" || zone == "z") {
    return 0;
  }
  std::string digits = StringUtils::removeChars(zone.substr(1), ":");
  if (digits.size() != 4) {
    return 0;
  }
  int minutes = std::stoi(digits.substr(0, 2)) * 60 + std::stoi(digits.substr(2));
  return zone[0] == '-' ? -minutes : minutes;
}

} // namespace

bool isValidCalendarDate(int year, int month, int day) {
  if (month < 1 || month > 12 || day < 1) {
    return false;
  }
  static const int DAYS_IN_MONTH[] = {31, 28, 31, 30, 31, 30,
                                      31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  int maxDay = DAYS_IN_MONTH[month - 1] + ((month == 2 && leap) ? 1 : 0);
  return day <= maxDay;
}

int64_t daysFromCivil(int year, int month, int day) {
  int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
  int64_t era = (y >= 0 ? y : y - 399) / 400;
  int64_t yoe = y - era * 400;
  int64_t mp = (month + 9) % 12;
  int64_t doy = (153 * mp + 2) / 5 + day - 1;
  int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

std::optional<int64_t> parseIsoDate(const std::string &value) {
  static const std::regex ISO_PATTERN(
      R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?(Z|z|[+-]\d{2}:?\d{2})?)?$)");

  std::smatch m;
  std::string trimmed = StringUtils::trim(value);
  if (!std::regex_match(trimmed, m, ISO_PATTERN)) {
    return std::nullopt;
  }
  return toEpochMillis(toInt(m[1]), toInt(m[2]), toInt(m[3]), toInt(m[4]),
                       toInt(m[5]), toInt(m[6]), parseFraction(m[7]),
                       parseOffset(m[8]));
}

std::optional<int64_t> parseDate(const std::string &value) {
  std::string trimmed = StringUtils::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  if (auto iso = parseIsoDate(trimmed)) {
    return iso;
  }

  static const std::regex SLASH_YMD(R"(^(\d{4})/(\d{1,2})/(\d{1,2})$)");
  static const std::regex SLASH_MDY(
      R"(^(\d{1,2})/(\d{1,2})/(\d{4})(?:,?\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?$)");
  static const std::regex DOTTED_DMY(R"(^(\d{1,2})\.(\d{1,2})\.(\d{4})$)");
  static const std::regex MONTH_FIRST(
      R"(^(?:[A-Za-z]{3,9},?\s+)?([A-Za-z]{3,9})\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?(?:\s*(?:GMT|UTC|Z))?$)");
  static const std::regex DAY_FIRST(
      R"(^(?:[A-Za-z]{3,9},?\s+)?(\d{1,2})\.?\s+([A-Za-z]{3,9})\.?,?\s+(\d{4})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?(?:\s*(?:GMT|UTC|Z))?$)");

  std::smatch m;
  if (std::regex_match(trimmed, m, SLASH_YMD)) {
    return toEpochMillis(toInt(m[1]), toInt(m[2]), toInt(m[3]), 0, 0, 0, 0,
                         0);
  }
  if (std::regex_match(trimmed, m, SLASH_MDY)) {
    return toEpochMillis(toInt(m[3]), toInt(m[1]), toInt(m[2]), toInt(m[4]),
                         toInt(m[5]), toInt(m[6]), 0, 0);
  }
  if (std::regex_match(trimmed, m, DOTTED_DMY)) {
    return toEpochMillis(toInt(m[3]), toInt(m[2]), toInt(m[1]), 0, 0, 0, 0,
                         0);
  }
  if (std::regex_match(trimmed, m, MONTH_FIRST)) {
    int month = monthFromName(m[1].str());
    if (month == 0) {
      return std::nullopt;
    }
    return toEpochMillis(toInt(m[3]), month, toInt(m[2]), toInt(m[4]),
                         toInt(m[5]), toInt(m[6]), 0, 0);
  }
  if (std::regex_match(trimmed, m, DAY_FIRST)) {
    int month = monthFromName(m[2].str());
    if (month == 0) {
      return std::nullopt;
    }
    return toEpochMillis(toInt(m[3]), month, toInt(m[1]), toInt(m[4]),
                         toInt(m[5]), toInt(m[6]), 0, 0);
  }
  return std::nullopt;
}

std::string formatIsoDate(int64_t epochMillis) {
  int64_t seconds = epochMillis / 1000;
  int64_t millis = epochMillis % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  struct tm tm_buf;
  if (!gmtime_r(&t, &tm_buf)) {
    return "";
  }

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0')
     << std::setw(3) << millis << "Z";
  return ss.str();
}

} // namespace TimeUtils
