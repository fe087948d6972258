#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  CONFIG = 1,
  GEO = 2,
  SCHEMA = 3,
  MAPPING = 4,
  SIMILARITY = 5,
  UNKNOWN = 99
};

// Process-wide logger. Every record is one line of the form
// "[timestamp] [LEVEL] [CATEGORY] [function] message". Detectors log under
// their own category and pass "Class::method" as the function.
class Logger {
private:
  static std::unique_ptr<ILogWriter> writer_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

public:
  static void initialize(std::unique_ptr<ILogWriter> writer = nullptr);
  static void shutdown();

  static void info(const std::string &message) {
    writeLog(LogLevel::INFO, LogCategory::SYSTEM, "", message);
  }

  static void error(const std::string &function, const std::string &message) {
    writeLog(LogLevel::ERROR, LogCategory::SYSTEM, function, message);
  }

  static void debug(LogCategory category, const std::string &message) {
    writeLog(LogLevel::DEBUG, category, "", message);
  }

  static void warning(LogCategory category, const std::string &message) {
    writeLog(LogLevel::WARNING, category, "", message);
  }

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void setLogLevel(LogLevel level);
  // Returns false for an unknown name.
  static bool setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
  static LogCategory stringToCategory(const std::string &categoryStr);
};

#endif
