#ifndef TEST_RUNNER_H
#define TEST_RUNNER_H

#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

class TestRunner {
private:
  int testsPassed = 0;
  int testsFailed = 0;
  std::string currentTest = "";

  void fail(const std::string &message) {
    std::cerr << "  [FAIL] " << currentTest << ": " << message << std::endl;
    testsFailed++;
  }

public:
  void assertTrue(bool condition, const std::string &message) {
    if (!condition) {
      fail(message);
      return;
    }
    testsPassed++;
  }

  void assertFalse(bool condition, const std::string &message) {
    assertTrue(!condition, message);
  }

  template <typename T, typename U>
  void assertEquals(const T &expected, const U &actual,
                    const std::string &message) {
    if (!(expected == actual)) {
      fail(message);
      std::ostringstream detail;
      detail << "    Expected: " << expected << "\n    Actual: " << actual;
      std::cerr << detail.str() << std::endl;
      return;
    }
    testsPassed++;
  }

  void assertNear(double expected, double actual, double tolerance,
                  const std::string &message) {
    if (std::fabs(expected - actual) > tolerance) {
      fail(message);
      std::cerr << "    Expected: " << expected << " (+/- " << tolerance
                << ")\n    Actual: " << actual << std::endl;
      return;
    }
    testsPassed++;
  }

  void assertGreaterOrEqual(double expected, double actual,
                            const std::string &message) {
    if (actual < expected) {
      fail(message);
      std::cerr << "    Expected at least: " << expected
                << "\n    Actual: " << actual << std::endl;
      return;
    }
    testsPassed++;
  }

  template <typename Exception>
  void assertThrows(const std::function<void()> &action,
                    const std::string &message) {
    try {
      action();
    } catch (const Exception &) {
      testsPassed++;
      return;
    } catch (const std::exception &e) {
      fail(message + " (threw a different exception: " + e.what() + ")");
      return;
    }
    fail(message + " (nothing thrown)");
  }

  void runTest(const std::string &testName,
               std::function<void()> testFunction) {
    currentTest = testName;
    std::cout << "[TEST] " << testName << std::endl;
    try {
      testFunction();
      std::cout << "  [PASS]" << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "  [FAIL] Exception: " << e.what() << std::endl;
      testsFailed++;
    }
  }

  void printSummary() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "TEST SUMMARY" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Passed: " << testsPassed << std::endl;
    std::cout << "Failed: " << testsFailed << std::endl;
    std::cout << "Total: " << (testsPassed + testsFailed) << std::endl;
    std::cout << "========================================\n" << std::endl;

    if (testsFailed == 0) {
      std::cout << "ALL TESTS PASSED" << std::endl;
      exit(0);
    } else {
      std::cout << "SOME TESTS FAILED" << std::endl;
      exit(1);
    }
  }
};

#endif
