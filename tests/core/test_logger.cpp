#include "core/file_log_writer.h"
#include "core/logger.h"
#include "../test_runner.h"
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

class MemoryLogWriter : public ILogWriter {
public:
  explicit MemoryLogWriter(std::shared_ptr<std::vector<std::string>> lines)
      : lines_(std::move(lines)) {}

  bool write(const std::string &formattedMessage) override {
    lines_->push_back(formattedMessage);
    return true;
  }
  void flush() override {}
  void close() override { open_ = false; }
  bool isOpen() const override { return open_; }

private:
  std::shared_ptr<std::vector<std::string>> lines_;
  bool open_ = true;
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string readFile(const std::string &path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

bool fileExists(const std::string &path) {
  std::ifstream in(path);
  return in.good();
}

} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Lines carry level, category and function", [&]() {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger::initialize(std::make_unique<MemoryLogWriter>(lines));
    Logger::setLogLevel(LogLevel::DEBUG);

    Logger::info(LogCategory::GEO, "GeoColumnDetector::detect", "found lat/lon");
    runner.assertEquals(size_t(1), lines->size(), "one line written");
    const std::string &line = lines->front();
    runner.assertTrue(contains(line, "[INFO] [GEO] [GeoColumnDetector::detect] found lat/lon"),
                      "formatted line: " + line);
    runner.assertTrue(line.front() == '[', "starts with the timestamp");
    Logger::shutdown();
  });

  runner.runTest("Records below the level are dropped", [&]() {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger::initialize(std::make_unique<MemoryLogWriter>(lines));
    Logger::setLogLevel(LogLevel::WARNING);

    Logger::debug(LogCategory::SCHEMA, "dropped");
    Logger::info("dropped too");
    Logger::warning(LogCategory::SCHEMA, "kept");
    Logger::error("ProgressiveSchemaBuilder", "kept too");

    runner.assertEquals(size_t(2), lines->size(), "only warning and error kept");
    runner.assertTrue(contains((*lines)[1], "[ERROR] [SYSTEM] [ProgressiveSchemaBuilder]"),
                      "function overload uses SYSTEM category");
    Logger::shutdown();
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("Level names parse case-insensitively", [&]() {
    runner.assertTrue(Logger::setLogLevel("debug"), "debug accepted");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::DEBUG, "level is DEBUG");
    runner.assertTrue(Logger::setLogLevel("WARN"), "WARN alias accepted");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::WARNING, "level is WARNING");
    runner.assertFalse(Logger::setLogLevel("verbose"), "unknown level rejected");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::WARNING, "level unchanged");
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("Category names", [&]() {
    runner.assertTrue(Logger::stringToCategory("SIMILARITY") == LogCategory::SIMILARITY,
                      "SIMILARITY known");
    runner.assertTrue(Logger::stringToCategory("nonsense") == LogCategory::UNKNOWN,
                      "unknown category");
  });

  runner.runTest("File writer appends lines", [&]() {
    const std::string path = "schemascout_logger_test.log";
    std::remove(path.c_str());
    Logger::initialize(std::make_unique<FileLogWriter>(path));
    Logger::info(LogCategory::MAPPING, "SchemaMappingEngine", "written to file");
    Logger::shutdown();

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    runner.assertTrue(contains(content, "[MAPPING] [SchemaMappingEngine] written to file"),
                      "file holds the record");
    std::remove(path.c_str());
  });

  runner.runTest("File writer rotates and keeps a bounded backup count", [&]() {
    const std::string path = "schemascout_rotation_test.log";
    const std::vector<std::string> files = {path, path + ".1", path + ".2", path + ".3"};
    for (const auto &file : files) {
      std::remove(file.c_str());
    }

    {
      FileLogWriter writer(path, 10, 2);
      runner.assertTrue(writer.write("first record line"), "first write");
      runner.assertTrue(writer.write("second record line"), "second write");
      runner.assertTrue(writer.write("third record line"), "third write");
      runner.assertTrue(writer.write("fourth record line"), "fourth write");
      writer.close();
    }

    runner.assertTrue(contains(readFile(path), "fourth record line"), "active file is newest");
    runner.assertTrue(contains(readFile(path + ".1"), "third record line"), "first backup");
    runner.assertTrue(contains(readFile(path + ".2"), "second record line"), "second backup");
    runner.assertFalse(fileExists(path + ".3"), "no third backup");
    for (const auto &name : {path, path + ".1", path + ".2"}) {
      runner.assertFalse(contains(readFile(name), "first record line"), "oldest dropped");
    }

    runner.assertThrows<std::invalid_argument>([&]() { FileLogWriter bad(path, 10, 0); },
                                               "at least one backup");

    for (const auto &file : files) {
      std::remove(file.c_str());
    }
  });

  runner.printSummary();
  return 0;
}
