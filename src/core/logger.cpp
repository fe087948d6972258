#include "core/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string levelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string categoryName(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::GEO:
    return "GEO";
  case LogCategory::SCHEMA:
    return "SCHEMA";
  case LogCategory::MAPPING:
    return "MAPPING";
  case LogCategory::SIMILARITY:
    return "SIMILARITY";
  case LogCategory::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

// Local time with milliseconds, e.g. 2024-01-15 10:00:00.123
std::string localTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
  struct tm tm_buf;
  localtime_r(&seconds, &tm_buf);

  std::ostringstream out;
  out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return out.str();
}

std::string formatRecord(LogLevel level, LogCategory category,
                         const std::string &function, const std::string &message) {
  std::ostringstream out;
  out << "[" << localTimestamp() << "] [" << levelName(level) << "] ["
      << categoryName(category) << "]";
  if (!function.empty()) {
    out << " [" << function << "]";
  }
  out << " " << message;
  return out.str();
}

} // namespace

std::unique_ptr<ILogWriter> Logger::writer_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM}, {"CONFIG", LogCategory::CONFIG},
    {"GEO", LogCategory::GEO},       {"SCHEMA", LogCategory::SCHEMA},
    {"MAPPING", LogCategory::MAPPING}, {"SIMILARITY", LogCategory::SIMILARITY}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},  {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING}, {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},  {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

// Without an open writer, WARNING and above still reach stderr so that
// failures before the log file exists are visible.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  if (level < getCurrentLogLevel()) {
    return;
  }

  const std::string line = formatRecord(level, category, function, message);

  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_ && writer_->isOpen() && writer_->write(line)) {
    return;
  }
  if (level >= LogLevel::WARNING) {
    std::cerr << line << std::endl;
  }
}

void Logger::initialize(std::unique_ptr<ILogWriter> writer) {
  std::lock_guard<std::mutex> lock(logMutex);

  if (writer_) {
    writer_->close();
    writer_.reset();
  }

  if (writer && !writer->isOpen()) {
    std::cerr << "Warning: log writer could not be opened. "
                 "Logging falls back to stderr."
              << std::endl;
    return;
  }

  writer_ = std::move(writer);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_) {
    writer_->flush();
    writer_->close();
  }
  writer_.reset();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

bool Logger::setLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  auto it = levelMap.find(upper);
  if (it == levelMap.end()) {
    return false;
  }
  setLogLevel(it->second);
  return true;
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(categoryStr);
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}
