#include "geo/geo_column_detector.h"
#include "core/engine_config.h"
#include "core/logger.h"
#include "geo/coordinate_parser.h"
#include "geo/geo_patterns.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace {

constexpr size_t COMBINED_SAMPLE_VALUES = 10;
constexpr size_t MIN_HEURISTIC_NUMERIC = 5;
constexpr double HEURISTIC_MIN_RATIO = 0.7;
constexpr double SWAP_MAJORITY = 0.5;

struct ColumnProfile {
  std::string header;
  size_t coordinateShaped = 0;
  size_t latitudeShaped = 0;
  size_t longitudeOnly = 0;
  size_t total = 0;
  std::set<double> distinct;
};

bool isBlank(const FieldValue *value) {
  if (value == nullptr || value->isNull()) {
    return true;
  }
  return value->isString() && StringUtils::trim(value->asString()).empty();
}

GeoColumnResult notFound() {
  GeoColumnResult result;
  result.found = false;
  result.type = GeoColumnType::NONE;
  result.confidence = 0.0;
  return result;
}

} // namespace

GeoColumnResult GeoColumnDetector::detect(const std::vector<std::string> &headers,
                                          const std::vector<Row> &rows) const {
  Logger::info(LogCategory::GEO, "GeoColumnDetector::detect",
               "Detecting geo columns from " + std::to_string(headers.size()) +
                   " headers and " + std::to_string(rows.size()) + " rows");

  auto latColumn =
      findColumnByPatterns(headers, GeoPatterns::latitudePatterns());
  auto lonColumn =
      findColumnByPatterns(headers, GeoPatterns::longitudePatterns());

  if (latColumn && lonColumn) {
    PairValidation validation =
        validateCoordinatePairs(rows, *latColumn, *lonColumn);
    if (validation.isValid) {
      GeoColumnResult result;
      result.found = true;
      result.type = GeoColumnType::SEPARATE;
      result.latColumn = *latColumn;
      result.lonColumn = *lonColumn;
      result.confidence = validation.confidence;
      result.detectionMethod = DetectionMethod::PATTERN;
      result.swappedCoordinates = validation.swapped;
      return result;
    }
    Logger::debug(LogCategory::GEO, "GeoColumnDetector::detect",
                  "Columns '" + *latColumn + "'/'" + *lonColumn +
                      "' matched by name but failed value validation");
  }

  auto combinedColumn =
      findColumnByPatterns(headers, GeoPatterns::combinedPatterns());
  if (combinedColumn) {
    FormatDetectionResult format =
        detectCombinedFormat(rows, *combinedColumn, CombinedFormat::AUTO);
    if (format.isValid) {
      GeoColumnResult result;
      result.found = true;
      result.type = GeoColumnType::COMBINED;
      result.combinedColumn = *combinedColumn;
      result.format = format.format;
      result.confidence = format.confidence;
      result.detectionMethod = DetectionMethod::PATTERN;
      return result;
    }
  }

  GeoColumnResult heuristic = detectByHeuristics(headers, rows);
  if (heuristic.found) {
    return heuristic;
  }

  Logger::debug(LogCategory::GEO, "GeoColumnDetector::detect",
                "No coordinate columns found");
  return notFound();
}

GeoColumnResult
GeoColumnDetector::validateManualSelection(const std::vector<Row> &rows,
                                           const std::string &latColumn,
                                           const std::string &lonColumn) const {
  if (latColumn.empty() || lonColumn.empty()) {
    throw std::invalid_argument("Manual geo selection requires both columns");
  }

  PairValidation validation = validateCoordinatePairs(rows, latColumn, lonColumn);
  GeoColumnResult result;
  result.found = validation.isValid;
  result.type = validation.isValid ? GeoColumnType::SEPARATE : GeoColumnType::NONE;
  result.latColumn = latColumn;
  result.lonColumn = lonColumn;
  result.confidence = validation.confidence;
  result.detectionMethod = DetectionMethod::MANUAL;
  result.swappedCoordinates = validation.swapped;

  if (!validation.isValid) {
    Logger::warning(LogCategory::GEO,
                    "GeoColumnDetector::validateManualSelection",
                    "Selected columns '" + latColumn + "'/'" + lonColumn +
                        "' do not hold valid coordinates");
  }
  return result;
}

GeoColumnResult
GeoColumnDetector::validateManualCombined(const std::vector<Row> &rows,
                                          const std::string &column,
                                          CombinedFormat format) const {
  if (column.empty()) {
    throw std::invalid_argument("Manual geo selection requires a column");
  }

  FormatDetectionResult detected = detectCombinedFormat(rows, column, format);
  GeoColumnResult result;
  result.found = detected.isValid;
  result.type = detected.isValid ? GeoColumnType::COMBINED : GeoColumnType::NONE;
  result.combinedColumn = column;
  if (detected.isValid) {
    result.format = detected.format;
  }
  result.confidence = detected.confidence;
  result.detectionMethod = DetectionMethod::MANUAL;

  if (!detected.isValid) {
    Logger::warning(LogCategory::GEO, "GeoColumnDetector::validateManualCombined",
                    "Selected column '" + column +
                        "' does not hold combined coordinates");
  }
  return result;
}

std::optional<std::string> GeoColumnDetector::findColumnByPatterns(
    const std::vector<std::string> &headers,
    const std::vector<std::regex> &patterns) const {
  for (const auto &header : headers) {
    if (GeoPatterns::matchesAny(patterns, StringUtils::trim(header))) {
      Logger::debug(LogCategory::GEO, "GeoColumnDetector::findColumnByPatterns",
                    "Column '" + header + "' matches a coordinate pattern");
      return header;
    }
  }
  return std::nullopt;
}

// Only rows where both columns are present take part. A row counts as
// swapped when the "latitude" is out of latitude range but fits longitude
// while the "longitude" fits latitude. When swapped rows are the majority
// the pair is re-validated as (lon, lat).
PairValidation
GeoColumnDetector::validateCoordinatePairs(const std::vector<Row> &rows,
                                           const std::string &latColumn,
                                           const std::string &lonColumn) const {
  PairValidation validation;
  const size_t limit = std::min(rows.size(), EngineConfig::getPairSampleRows());

  size_t nonNull = 0;
  size_t valid = 0;
  size_t swapped = 0;
  size_t validWhenSwapped = 0;

  for (size_t i = 0; i < limit; ++i) {
    const FieldValue *latValue = findField(rows[i], latColumn);
    const FieldValue *lonValue = findField(rows[i], lonColumn);
    if (latValue == nullptr || lonValue == nullptr) {
      continue;
    }

    auto lat = CoordinateParser::parseCoordinate(*latValue);
    auto lon = CoordinateParser::parseCoordinate(*lonValue);
    if (!lat || !lon) {
      continue;
    }

    ++nonNull;
    if (CoordinateParser::isValidCoordinate(lat, lon)) {
      ++valid;
    }
    if (std::fabs(*lat) > 90.0 && std::fabs(*lat) <= 180.0 &&
        std::fabs(*lon) <= 90.0) {
      ++swapped;
    }
    if (CoordinateParser::isValidCoordinate(lon, lat)) {
      ++validWhenSwapped;
    }
  }

  if (nonNull == 0) {
    return validation;
  }

  const double total = static_cast<double>(nonNull);
  const double threshold = EngineConfig::getPairValidationRatio();

  if (static_cast<double>(swapped) / total > SWAP_MAJORITY) {
    validation.confidence = static_cast<double>(validWhenSwapped) / total;
    validation.isValid = validation.confidence >= threshold;
    validation.swapped = true;
    Logger::info(LogCategory::GEO, "GeoColumnDetector::validateCoordinatePairs",
                 "Columns '" + latColumn + "'/'" + lonColumn +
                     "' look swapped");
    return validation;
  }

  validation.confidence = static_cast<double>(valid) / total;
  validation.isValid = validation.confidence >= threshold;
  return validation;
}

FormatDetectionResult
GeoColumnDetector::detectCombinedFormat(const std::vector<Row> &rows,
                                        const std::string &column,
                                        CombinedFormat format) const {
  std::vector<FieldValue> samples;
  for (const auto &row : rows) {
    if (samples.size() >= COMBINED_SAMPLE_VALUES) {
      break;
    }
    const FieldValue *value = findField(row, column);
    if (!isBlank(value)) {
      samples.push_back(*value);
    }
  }

  if (samples.empty()) {
    return FormatDetectionResult{};
  }
  return formatDetector_.detectFormat(samples, format);
}

// Value-only fallback for files whose headers say nothing. A latitude
// candidate must hold only |v| <= 90; the longitude candidate is the best
// other column by share of coordinate-shaped values. Constant columns are
// skipped because they are usually ids or flags.
GeoColumnResult
GeoColumnDetector::detectByHeuristics(const std::vector<std::string> &headers,
                                      const std::vector<Row> &rows) const {
  const size_t limit =
      std::min(rows.size(), EngineConfig::getHeuristicSampleRows());
  const double minNumeric = std::min(static_cast<double>(MIN_HEURISTIC_NUMERIC),
                                     static_cast<double>(rows.size()) * 0.5);

  std::vector<ColumnProfile> profiles;
  for (const auto &header : headers) {
    ColumnProfile profile;
    profile.header = header;

    for (size_t i = 0; i < limit; ++i) {
      const FieldValue *value = findField(rows[i], header);
      if (value == nullptr) {
        continue;
      }
      auto parsed = CoordinateParser::parseCoordinate(*value);
      if (!parsed || std::isnan(*parsed)) {
        continue;
      }
      ++profile.total;
      profile.distinct.insert(*parsed);

      const double magnitude = std::fabs(*parsed);
      if (magnitude <= 90.0) {
        ++profile.coordinateShaped;
        ++profile.latitudeShaped;
      } else if (magnitude <= 180.0) {
        ++profile.coordinateShaped;
        ++profile.longitudeOnly;
      }
    }

    if (profile.total > 0 && static_cast<double>(profile.total) >= minNumeric) {
      profiles.push_back(std::move(profile));
    }
  }

  std::optional<std::string> bestLat;
  std::optional<std::string> bestLon;
  double bestLatScore = 0.0;
  double bestLonScore = 0.0;

  for (const auto &profile : profiles) {
    const double ratio = static_cast<double>(profile.coordinateShaped) /
                         static_cast<double>(profile.total);
    if (profile.latitudeShaped == profile.total && ratio > bestLatScore &&
        profile.distinct.size() > 1) {
      bestLat = profile.header;
      bestLatScore = ratio;
    }
  }

  for (const auto &profile : profiles) {
    if (bestLat && profile.header == *bestLat) {
      continue;
    }
    const double ratio = static_cast<double>(profile.coordinateShaped) /
                         static_cast<double>(profile.total);
    if (ratio > bestLonScore && profile.distinct.size() > 1) {
      bestLon = profile.header;
      bestLonScore = ratio;
    }
  }

  if (!bestLat || !bestLon || bestLatScore < HEURISTIC_MIN_RATIO ||
      bestLonScore < HEURISTIC_MIN_RATIO) {
    return notFound();
  }

  PairValidation validation = validateCoordinatePairs(rows, *bestLat, *bestLon);
  if (!validation.isValid && !validation.swapped) {
    return notFound();
  }

  Logger::info(LogCategory::GEO, "GeoColumnDetector::detectByHeuristics",
               "Heuristic match: lat='" + *bestLat + "' lon='" + *bestLon + "'");

  GeoColumnResult result;
  result.found = true;
  result.type = GeoColumnType::SEPARATE;
  result.latColumn = *bestLat;
  result.lonColumn = *bestLon;
  result.confidence = validation.confidence;
  result.detectionMethod = DetectionMethod::HEURISTIC;
  result.swappedCoordinates = validation.swapped;
  return result;
}
