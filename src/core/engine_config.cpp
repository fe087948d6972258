#include "core/engine_config.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Static member initialization for EngineConfig. Every knob starts at its
// DEFAULT_ value and can be changed at runtime through the validated
// setters or loadFromFile().
std::atomic<size_t> EngineConfig::MAX_UNIQUE_VALUES =
    EngineConfig::DEFAULT_MAX_UNIQUE_VALUES;
std::atomic<size_t> EngineConfig::MAX_SAMPLES =
    EngineConfig::DEFAULT_MAX_SAMPLES;
std::atomic<size_t> EngineConfig::ENUM_THRESHOLD =
    EngineConfig::DEFAULT_ENUM_THRESHOLD;
std::atomic<EnumMode> EngineConfig::ENUM_MODE{EngineConfig::DEFAULT_ENUM_MODE};
std::atomic<size_t> EngineConfig::MAX_DEPTH = EngineConfig::DEFAULT_MAX_DEPTH;
std::atomic<size_t> EngineConfig::PAIR_SAMPLE_ROWS =
    EngineConfig::DEFAULT_PAIR_SAMPLE_ROWS;
std::atomic<size_t> EngineConfig::HEURISTIC_SAMPLE_ROWS =
    EngineConfig::DEFAULT_HEURISTIC_SAMPLE_ROWS;
std::atomic<double> EngineConfig::FORMAT_CONFIDENCE_THRESHOLD{
    EngineConfig::DEFAULT_FORMAT_CONFIDENCE_THRESHOLD};
std::atomic<double> EngineConfig::PAIR_VALIDATION_RATIO{
    EngineConfig::DEFAULT_PAIR_VALIDATION_RATIO};
std::atomic<bool> EngineConfig::REJECT_ZERO_COORDINATES{
    EngineConfig::DEFAULT_REJECT_ZERO_COORDINATES};
std::atomic<size_t> EngineConfig::MIN_SIMILARITY_SCORE =
    EngineConfig::DEFAULT_MIN_SIMILARITY_SCORE;
std::atomic<size_t> EngineConfig::MAX_SIMILARITY_RESULTS =
    EngineConfig::DEFAULT_MAX_SIMILARITY_RESULTS;
std::atomic<size_t> EngineConfig::MIN_RENAME_CONFIDENCE =
    EngineConfig::DEFAULT_MIN_RENAME_CONFIDENCE;

void EngineConfig::setEnumMode(const std::string &mode) {
  std::string normalized = StringUtils::toLower(StringUtils::trim(mode));
  if (normalized == "count") {
    ENUM_MODE = EnumMode::COUNT;
  } else if (normalized == "percentage") {
    ENUM_MODE = EnumMode::PERCENTAGE;
  } else {
    throw std::invalid_argument("ENUM_MODE must be 'count' or 'percentage', "
                                "got '" +
                                mode + "'");
  }
}

void EngineConfig::resetToDefaults() {
  MAX_UNIQUE_VALUES = DEFAULT_MAX_UNIQUE_VALUES;
  MAX_SAMPLES = DEFAULT_MAX_SAMPLES;
  ENUM_THRESHOLD = DEFAULT_ENUM_THRESHOLD;
  ENUM_MODE = DEFAULT_ENUM_MODE;
  MAX_DEPTH = DEFAULT_MAX_DEPTH;
  PAIR_SAMPLE_ROWS = DEFAULT_PAIR_SAMPLE_ROWS;
  HEURISTIC_SAMPLE_ROWS = DEFAULT_HEURISTIC_SAMPLE_ROWS;
  FORMAT_CONFIDENCE_THRESHOLD = DEFAULT_FORMAT_CONFIDENCE_THRESHOLD;
  PAIR_VALIDATION_RATIO = DEFAULT_PAIR_VALIDATION_RATIO;
  REJECT_ZERO_COORDINATES = DEFAULT_REJECT_ZERO_COORDINATES;
  MIN_SIMILARITY_SCORE = DEFAULT_MIN_SIMILARITY_SCORE;
  MAX_SIMILARITY_RESULTS = DEFAULT_MAX_SIMILARITY_RESULTS;
  MIN_RENAME_CONFIDENCE = DEFAULT_MIN_RENAME_CONFIDENCE;
}

namespace {

// Applies one key from the "engine" section. A value of the wrong JSON type
// or outside the setter's range is logged and the previous value is kept,
// so one bad entry does not discard the rest of the file.
void applySetting(const json &section, const std::string &key,
                  const std::function<void(const json &)> &apply) {
  if (!section.contains(key)) {
    return;
  }
  try {
    apply(section.at(key));
  } catch (const std::invalid_argument &e) {
    Logger::error(LogCategory::CONFIG, "EngineConfig",
                  "Invalid value for '" + key + "': " + e.what());
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "EngineConfig",
                  "Wrong type for '" + key + "': " + e.what());
  }
}

} // namespace

// Loads detection settings from a JSON file of the form
//   { "engine": { "max_unique_values": 100, ... },
//     "logging": { "level": "INFO" } }
// Keys are snake_case versions of the static members. A missing file is not
// an error: a warning is logged and the current values stay in effect.
// Returns true when the file was read and parsed.
bool EngineConfig::loadFromFile(const std::string &path) {
  std::ifstream configFile(path);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig",
                    "Could not open config file '" + path +
                        "', using defaults");
    return false;
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    Logger::error(LogCategory::CONFIG, "EngineConfig",
                  "Failed to parse config file '" + path + "': " + e.what());
    return false;
  }

  if (config.contains("engine") && config["engine"].is_object()) {
    const json &engine = config["engine"];

    applySetting(engine, "max_unique_values", [](const json &v) {
      setMaxUniqueValues(v.get<size_t>());
    });
    applySetting(engine, "max_samples",
                 [](const json &v) { setMaxSamples(v.get<size_t>()); });
    applySetting(engine, "enum_threshold",
                 [](const json &v) { setEnumThreshold(v.get<size_t>()); });
    applySetting(engine, "enum_mode",
                 [](const json &v) { setEnumMode(v.get<std::string>()); });
    applySetting(engine, "max_depth",
                 [](const json &v) { setMaxDepth(v.get<size_t>()); });
    applySetting(engine, "pair_sample_rows",
                 [](const json &v) { setPairSampleRows(v.get<size_t>()); });
    applySetting(engine, "heuristic_sample_rows", [](const json &v) {
      setHeuristicSampleRows(v.get<size_t>());
    });
    applySetting(engine, "format_confidence_threshold", [](const json &v) {
      setFormatConfidenceThreshold(v.get<double>());
    });
    applySetting(engine, "pair_validation_ratio", [](const json &v) {
      setPairValidationRatio(v.get<double>());
    });
    applySetting(engine, "reject_zero_coordinates", [](const json &v) {
      setRejectZeroCoordinates(v.get<bool>());
    });
    applySetting(engine, "min_similarity_score", [](const json &v) {
      setMinSimilarityScore(v.get<size_t>());
    });
    applySetting(engine, "max_similarity_results", [](const json &v) {
      setMaxSimilarityResults(v.get<size_t>());
    });
    applySetting(engine, "min_rename_confidence", [](const json &v) {
      setMinRenameConfidence(v.get<size_t>());
    });
  }

  if (config.contains("logging") && config["logging"].is_object() &&
      config["logging"].contains("level")) {
    const json &level = config["logging"]["level"];
    if (!level.is_string() || !Logger::setLogLevel(level.get<std::string>())) {
      Logger::error(LogCategory::CONFIG, "EngineConfig",
                    "Invalid logging.level in '" + path + "'");
    }
  }

  Logger::info(LogCategory::CONFIG, "EngineConfig",
               "Configuration loaded from " + path);
  return true;
}
