#include "utils/time_utils.h"
#include "../test_runner.h"

int main() {
  TestRunner runner;
  const int64_t jan15 = 1705276800000;

  runner.runTest("Calendar validation", [&]() {
    runner.assertTrue(TimeUtils::isValidCalendarDate(2024, 2, 29), "leap day");
    runner.assertFalse(TimeUtils::isValidCalendarDate(2023, 2, 29), "not a leap year");
    runner.assertFalse(TimeUtils::isValidCalendarDate(2024, 13, 1), "month 13");
    runner.assertFalse(TimeUtils::isValidCalendarDate(2024, 4, 31), "April 31");
  });

  runner.runTest("ISO dates", [&]() {
    runner.assertEquals(jan15, *TimeUtils::parseIsoDate("2024-01-15"), "date only");
    runner.assertEquals(jan15 + 36000000, *TimeUtils::parseIsoDate("2024-01-15T10:00:00Z"),
                        "UTC time");
    runner.assertEquals(jan15 + 36000000,
                        *TimeUtils::parseIsoDate("2024-01-15T12:00:00+02:00"), "offset");
    runner.assertFalse(TimeUtils::parseIsoDate("2024-02-30").has_value(), "impossible day");
    runner.assertFalse(TimeUtils::parseIsoDate("15/01/2024").has_value(), "not ISO");
  });

  runner.runTest("Lenient date forms", [&]() {
    runner.assertEquals(jan15, *TimeUtils::parseDate("2024/01/15"), "YYYY/MM/DD");
    runner.assertEquals(jan15, *TimeUtils::parseDate("01/15/2024"), "MM/DD/YYYY");
    runner.assertEquals(jan15, *TimeUtils::parseDate("15.01.2024"), "DD.MM.YYYY");
    runner.assertEquals(jan15, *TimeUtils::parseDate("Jan 15, 2024"), "month first");
    runner.assertEquals(jan15, *TimeUtils::parseDate("15 January 2024"), "day first");
    runner.assertEquals(jan15 + 36000000,
                        *TimeUtils::parseDate("Mon, 15 Jan 2024 10:00:00 GMT"), "RFC 2822");
    runner.assertFalse(TimeUtils::parseDate("soon").has_value(), "free text");
    runner.assertFalse(TimeUtils::parseDate("Foo 15, 2024").has_value(), "unknown month");
  });

  runner.runTest("Formatting", [&]() {
    runner.assertEquals(std::string("2024-01-15T00:00:00.000Z"),
                        TimeUtils::formatIsoDate(jan15), "ISO output");
    runner.assertEquals(std::string("1969-12-31T23:59:59.999Z"), TimeUtils::formatIsoDate(-1),
                        "before the epoch");
  });

  runner.printSummary();
  return 0;
}
