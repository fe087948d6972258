#include "core/engine_config.h"
#include "core/file_log_writer.h"
#include "core/logger.h"
#include "mapping/mapping_engine.h"
#include "schema/schema_similarity.h"
#include "schema/transform_detector.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_USAGE_ERROR = 2;
constexpr int EXIT_INPUT_ERROR = 3;
constexpr int EXIT_UNKNOWN_ERROR = 5;
constexpr int EXIT_CONFIG_ERROR = 6;

constexpr size_t DEFAULT_BATCH_SIZE = 1000;

struct CliOptions {
  std::string inputPath;
  std::optional<std::string> language;
  size_t batchSize = DEFAULT_BATCH_SIZE;
  std::optional<std::string> stateIn;
  std::optional<std::string> stateOut;
  std::optional<std::string> configPath;
  std::optional<std::string> logFile;
  std::optional<std::string> logLevel;
  std::optional<std::string> previousSchema;
  std::optional<std::string> catalog;
};

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InputError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

void printUsage(std::ostream &out) {
  out << "Usage: schemascout <rows.json> [options]\n"
         "\n"
         "Input is a JSON array of row objects or JSON Lines.\n"
         "\n"
         "Options:\n"
         "  --language <code>        Mapping language (eng, deu, fra, spa, ita, nld, por)\n"
         "  --batch-size <n>         Rows per builder batch (default 1000)\n"
         "  --state-in <file>        Resume from an exported builder state\n"
         "  --state-out <file>       Write the builder state after processing\n"
         "  --config <file>          Engine configuration (JSON)\n"
         "  --log-file <file>        Append log records to a rotating file\n"
         "  --log-level <LEVEL>      DEBUG, INFO, WARNING, ERROR or CRITICAL\n"
         "  --previous-schema <file> Compare against a stored schema and suggest renames\n"
         "  --catalog <file>         Rank catalog datasets by similarity\n"
         "  --help                   Show this message\n";
}

CliOptions parseArguments(int argc, char *argv[]) {
  CliOptions options;
  auto requireValue = [&](int &i, const std::string &flag) -> std::string {
    if (i + 1 >= argc) {
      throw UsageError("Missing value for " + flag);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--language") {
      options.language = requireValue(i, arg);
    } else if (arg == "--batch-size") {
      const std::string value = requireValue(i, arg);
      try {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
          throw UsageError("--batch-size must be a positive integer");
        }
        options.batchSize = static_cast<size_t>(parsed);
      } catch (const std::logic_error &) {
        throw UsageError("--batch-size must be a positive integer");
      }
    } else if (arg == "--state-in") {
      options.stateIn = requireValue(i, arg);
    } else if (arg == "--state-out") {
      options.stateOut = requireValue(i, arg);
    } else if (arg == "--config") {
      options.configPath = requireValue(i, arg);
    } else if (arg == "--log-file") {
      options.logFile = requireValue(i, arg);
    } else if (arg == "--log-level") {
      options.logLevel = requireValue(i, arg);
    } else if (arg == "--previous-schema") {
      options.previousSchema = requireValue(i, arg);
    } else if (arg == "--catalog") {
      options.catalog = requireValue(i, arg);
    } else if (StringUtils::startsWith(arg, "--")) {
      throw UsageError("Unknown option " + arg);
    } else if (options.inputPath.empty()) {
      options.inputPath = arg;
    } else {
      throw UsageError("Unexpected argument " + arg);
    }
  }

  if (options.inputPath.empty()) {
    throw UsageError("No input file given");
  }
  return options;
}

std::string readFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw InputError("Cannot open " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

ordered_json readJsonFile(const std::string &path) {
  try {
    return ordered_json::parse(readFile(path));
  } catch (const ordered_json::parse_error &e) {
    throw InputError("Invalid JSON in " + path + ": " + e.what());
  }
}

// A JSON array of objects, or one object per line.
std::vector<Row> readRows(const std::string &path) {
  const std::string content = readFile(path);
  try {
    const std::string trimmed = StringUtils::trim(content);
    if (!trimmed.empty() && trimmed.front() == '[') {
      return rowsFromJson(ordered_json::parse(trimmed));
    }

    std::vector<Row> rows;
    std::istringstream lines(content);
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(lines, line)) {
      ++lineNumber;
      if (StringUtils::trim(line).empty()) {
        continue;
      }
      try {
        rows.push_back(rowFromJson(ordered_json::parse(line)));
      } catch (const std::exception &e) {
        throw InputError(path + ":" + std::to_string(lineNumber) + ": " + e.what());
      }
    }
    return rows;
  } catch (const ordered_json::parse_error &e) {
    throw InputError("Invalid JSON in " + path + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw InputError(path + ": " + e.what());
  }
}

std::vector<DatasetSchema> readCatalog(const std::string &path) {
  const ordered_json data = readJsonFile(path);
  if (!data.is_array()) {
    throw InputError("Catalog " + path + " must be a JSON array");
  }
  std::vector<DatasetSchema> catalog;
  for (const auto &entry : data) {
    try {
      catalog.push_back(DatasetSchema::fromJson(entry));
    } catch (const std::runtime_error &e) {
      throw InputError(path + ": " + e.what());
    }
  }
  return catalog;
}

void configureLogging(const CliOptions &options) {
  if (options.logFile) {
    Logger::initialize(std::make_unique<FileLogWriter>(*options.logFile));
  } else {
    Logger::initialize();
  }
  if (options.logLevel && !Logger::setLogLevel(*options.logLevel)) {
    throw UsageError("Unknown log level " + *options.logLevel);
  }
}

ordered_json buildReport(const CliOptions &options, const SchemaMappingEngine &engine,
                         const std::vector<Row> &rows,
                         const std::vector<SchemaChange> &changes) {
  const FieldMappingResult mappings = engine.detectMappings(options.language);
  const StructuralSchema schema = engine.getSchema();

  ordered_json report;
  report["language"] = mappings.language;
  report["mappings"] = mappings.toJson();
  report["schema"] = schema.toJson();
  report["summary"] = engine.getSummary().toJson();

  ordered_json changeList = ordered_json::array();
  for (const auto &change : changes) {
    changeList.push_back(change.toJson());
  }
  report["changes"] = changeList;

  if (options.previousSchema) {
    StructuralSchema previous;
    try {
      previous = StructuralSchema::fromJson(readJsonFile(*options.previousSchema));
    } catch (const std::runtime_error &e) {
      throw InputError(*options.previousSchema + ": " + e.what());
    }
    const SchemaComparison comparison = compareSchemas(previous, schema);
    ordered_json transforms = ordered_json::array();
    for (const auto &suggestion :
         TransformDetector().detectTransforms(previous, schema, comparison.changes)) {
      transforms.push_back(suggestion.toJson());
    }
    report["comparison"] = comparison.toJson();
    report["comparisonSummary"] = generateChangeSummary(comparison);
    report["transforms"] = transforms;
  }

  if (options.catalog) {
    UploadedSchema uploaded;
    for (const auto &field : schema.fields()) {
      uploaded.headers.push_back(field.name);
    }
    uploaded.sampleData = engine.builder().sampleRows();
    uploaded.rowCount = rows.size();

    ordered_json similar = ordered_json::array();
    for (const auto &result : SchemaSimilarity().findSimilarDatasets(
             uploaded, readCatalog(*options.catalog), mappings.language)) {
      similar.push_back(result.toJson());
    }
    report["similarDatasets"] = similar;
  }
  return report;
}

int run(const CliOptions &options) {
  if (options.configPath && !EngineConfig::loadFromFile(*options.configPath)) {
    std::cerr << "Error: could not load configuration " << *options.configPath
              << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  std::optional<ordered_json> previousState;
  if (options.stateIn) {
    previousState = readJsonFile(*options.stateIn);
  }

  std::unique_ptr<SchemaMappingEngine> engine;
  try {
    engine = std::make_unique<SchemaMappingEngine>(previousState);
  } catch (const std::runtime_error &e) {
    throw InputError("Cannot restore state: " + std::string(e.what()));
  }

  const std::vector<Row> rows = readRows(options.inputPath);
  Logger::info(LogCategory::SYSTEM, "main",
               "Read " + std::to_string(rows.size()) + " rows from " +
                   options.inputPath);

  std::vector<SchemaChange> changes;
  for (size_t start = 0; start < rows.size(); start += options.batchSize) {
    const size_t end = std::min(rows.size(), start + options.batchSize);
    std::vector<Row> batch(rows.begin() + static_cast<std::ptrdiff_t>(start),
                           rows.begin() + static_cast<std::ptrdiff_t>(end));
    BatchResult result = engine->processBatch(batch);
    changes.insert(changes.end(), result.changes.begin(), result.changes.end());
  }

  std::cout << buildReport(options, *engine, rows, changes).dump(2) << std::endl;

  if (options.stateOut) {
    std::ofstream out(*options.stateOut);
    if (!out.is_open()) {
      throw InputError("Cannot write state to " + *options.stateOut);
    }
    out << engine->exportState().dump(2) << std::endl;
    Logger::info(LogCategory::SYSTEM, "main",
                 "State written to " + *options.stateOut);
  }
  return EXIT_SUCCESS_CODE;
}
} // namespace

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help") {
      printUsage(std::cout);
      return EXIT_SUCCESS_CODE;
    }
  }

  int exitCode = EXIT_SUCCESS_CODE;
  try {
    const CliOptions options = parseArguments(argc, argv);
    configureLogging(options);
    exitCode = run(options);
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    printUsage(std::cerr);
    exitCode = EXIT_USAGE_ERROR;
  } catch (const InputError &e) {
    Logger::error(LogCategory::SYSTEM, "main", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    exitCode = EXIT_INPUT_ERROR;
  } catch (const std::invalid_argument &e) {
    Logger::error(LogCategory::CONFIG, "main", e.what());
    std::cerr << "Configuration error: " << e.what() << std::endl;
    exitCode = EXIT_CONFIG_ERROR;
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main", e.what());
    std::cerr << "Unexpected error: " << e.what() << std::endl;
    exitCode = EXIT_UNKNOWN_ERROR;
  }

  Logger::shutdown();
  return exitCode;
}
