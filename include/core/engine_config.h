#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <atomic>
#include <stdexcept>
#include <string>

enum class EnumMode { COUNT = 0, PERCENTAGE = 1 };

// Process-wide detection knobs. Values are atomics so detectors can read
// them from any worker thread; setters validate against MIN_/MAX_ bounds
// and throw std::invalid_argument when out of range.
struct EngineConfig {
  static std::atomic<size_t> MAX_UNIQUE_VALUES;
  static std::atomic<size_t> MAX_SAMPLES;
  static std::atomic<size_t> ENUM_THRESHOLD;
  static std::atomic<EnumMode> ENUM_MODE;
  static std::atomic<size_t> MAX_DEPTH;
  static std::atomic<size_t> PAIR_SAMPLE_ROWS;
  static std::atomic<size_t> HEURISTIC_SAMPLE_ROWS;
  static std::atomic<double> FORMAT_CONFIDENCE_THRESHOLD;
  static std::atomic<double> PAIR_VALIDATION_RATIO;
  static std::atomic<bool> REJECT_ZERO_COORDINATES;
  static std::atomic<size_t> MIN_SIMILARITY_SCORE;
  static std::atomic<size_t> MAX_SIMILARITY_RESULTS;
  static std::atomic<size_t> MIN_RENAME_CONFIDENCE;

  static constexpr size_t DEFAULT_MAX_UNIQUE_VALUES = 100;
  static constexpr size_t DEFAULT_MAX_SAMPLES = 100;
  static constexpr size_t DEFAULT_ENUM_THRESHOLD = 50;
  static constexpr EnumMode DEFAULT_ENUM_MODE = EnumMode::COUNT;
  static constexpr size_t DEFAULT_MAX_DEPTH = 3;
  static constexpr size_t DEFAULT_PAIR_SAMPLE_ROWS = 10;
  static constexpr size_t DEFAULT_HEURISTIC_SAMPLE_ROWS = 20;
  static constexpr double DEFAULT_FORMAT_CONFIDENCE_THRESHOLD = 0.7;
  static constexpr double DEFAULT_PAIR_VALIDATION_RATIO = 0.5;
  static constexpr bool DEFAULT_REJECT_ZERO_COORDINATES = true;
  static constexpr size_t DEFAULT_MIN_SIMILARITY_SCORE = 30;
  static constexpr size_t DEFAULT_MAX_SIMILARITY_RESULTS = 5;
  static constexpr size_t DEFAULT_MIN_RENAME_CONFIDENCE = 60;

  static constexpr size_t MIN_MAX_UNIQUE_VALUES = 1;
  static constexpr size_t MAX_MAX_UNIQUE_VALUES = 10000;
  static constexpr size_t MIN_MAX_SAMPLES = 1;
  static constexpr size_t MAX_MAX_SAMPLES = 10000;
  static constexpr size_t MIN_ENUM_THRESHOLD = 1;
  static constexpr size_t MAX_ENUM_THRESHOLD = 10000;
  static constexpr size_t MIN_MAX_DEPTH = 1;
  static constexpr size_t MAX_MAX_DEPTH = 16;
  static constexpr size_t MIN_SAMPLE_ROWS = 1;
  static constexpr size_t MAX_SAMPLE_ROWS = 1000;
  static constexpr size_t MAX_SCORE = 100;
  static constexpr size_t MIN_MAX_SIMILARITY_RESULTS = 1;
  static constexpr size_t MAX_MAX_SIMILARITY_RESULTS = 1000;

  static void setMaxUniqueValues(size_t v) {
    checkRange("MAX_UNIQUE_VALUES", v, MIN_MAX_UNIQUE_VALUES,
               MAX_MAX_UNIQUE_VALUES);
    MAX_UNIQUE_VALUES = v;
  }

  static size_t getMaxUniqueValues() { return MAX_UNIQUE_VALUES; }

  static void setMaxSamples(size_t v) {
    checkRange("MAX_SAMPLES", v, MIN_MAX_SAMPLES, MAX_MAX_SAMPLES);
    MAX_SAMPLES = v;
  }

  static size_t getMaxSamples() { return MAX_SAMPLES; }

  static void setEnumThreshold(size_t v) {
    checkRange("ENUM_THRESHOLD", v, MIN_ENUM_THRESHOLD, MAX_ENUM_THRESHOLD);
    ENUM_THRESHOLD = v;
  }

  static size_t getEnumThreshold() { return ENUM_THRESHOLD; }

  static void setEnumMode(EnumMode mode) { ENUM_MODE = mode; }
  static void setEnumMode(const std::string &mode);
  static EnumMode getEnumMode() { return ENUM_MODE; }

  static void setMaxDepth(size_t v) {
    checkRange("MAX_DEPTH", v, MIN_MAX_DEPTH, MAX_MAX_DEPTH);
    MAX_DEPTH = v;
  }

  static size_t getMaxDepth() { return MAX_DEPTH; }

  static void setPairSampleRows(size_t v) {
    checkRange("PAIR_SAMPLE_ROWS", v, MIN_SAMPLE_ROWS, MAX_SAMPLE_ROWS);
    PAIR_SAMPLE_ROWS = v;
  }

  static size_t getPairSampleRows() { return PAIR_SAMPLE_ROWS; }

  static void setHeuristicSampleRows(size_t v) {
    checkRange("HEURISTIC_SAMPLE_ROWS", v, MIN_SAMPLE_ROWS, MAX_SAMPLE_ROWS);
    HEURISTIC_SAMPLE_ROWS = v;
  }

  static size_t getHeuristicSampleRows() { return HEURISTIC_SAMPLE_ROWS; }

  static void setFormatConfidenceThreshold(double v) {
    checkRatio("FORMAT_CONFIDENCE_THRESHOLD", v);
    FORMAT_CONFIDENCE_THRESHOLD = v;
  }

  static double getFormatConfidenceThreshold() {
    return FORMAT_CONFIDENCE_THRESHOLD;
  }

  static void setPairValidationRatio(double v) {
    checkRatio("PAIR_VALIDATION_RATIO", v);
    PAIR_VALIDATION_RATIO = v;
  }

  static double getPairValidationRatio() { return PAIR_VALIDATION_RATIO; }

  static void setRejectZeroCoordinates(bool v) { REJECT_ZERO_COORDINATES = v; }
  static bool getRejectZeroCoordinates() { return REJECT_ZERO_COORDINATES; }

  static void setMinSimilarityScore(size_t v) {
    checkRange("MIN_SIMILARITY_SCORE", v, 0, MAX_SCORE);
    MIN_SIMILARITY_SCORE = v;
  }

  static size_t getMinSimilarityScore() { return MIN_SIMILARITY_SCORE; }

  static void setMaxSimilarityResults(size_t v) {
    checkRange("MAX_SIMILARITY_RESULTS", v, MIN_MAX_SIMILARITY_RESULTS,
               MAX_MAX_SIMILARITY_RESULTS);
    MAX_SIMILARITY_RESULTS = v;
  }

  static size_t getMaxSimilarityResults() { return MAX_SIMILARITY_RESULTS; }

  static void setMinRenameConfidence(size_t v) {
    checkRange("MIN_RENAME_CONFIDENCE", v, 0, MAX_SCORE);
    MIN_RENAME_CONFIDENCE = v;
  }

  static size_t getMinRenameConfidence() { return MIN_RENAME_CONFIDENCE; }

  static void resetToDefaults();
  static bool loadFromFile(const std::string &path);

private:
  static void checkRange(const char *name, size_t v, size_t lo, size_t hi) {
    if (v < lo || v > hi) {
      throw std::invalid_argument(std::string(name) + " must be between " +
                                  std::to_string(lo) + " and " +
                                  std::to_string(hi));
    }
  }

  static void checkRatio(const char *name, double v) {
    if (!(v > 0.0 && v <= 1.0)) {
      throw std::invalid_argument(std::string(name) +
                                  " must be in the range (0, 1]");
    }
  }
};

#endif
