#include "geo/coordinate_validator.h"
#include "core/logger.h"
#include "geo/format_detector.h"
#include "utils/string_utils.h"
#include <array>
#include <cmath>

namespace {

constexpr double SWAP_DETECTION_RATIO = 0.7;
constexpr double INTEGER_PENALTY = 0.9;
constexpr double NEAR_BOUNDS_PENALTY = 0.95;
constexpr double NEAR_BOUNDS_MARGIN = 0.1;
constexpr double TEST_COORDINATE_PENALTY = 0.5;
constexpr double TEST_COORDINATE_TOLERANCE = 1e-4;

// Placeholder values that show up in sample spreadsheets and tutorials far
// more often than in real data.
constexpr std::array<std::pair<double, double>, 4> TEST_COORDINATES = {{
    {0.0, 0.0},
    {1.0, 1.0},
    {12.345, 67.89},
    {40.7128, -74.006},
}};

} // namespace

bool CoordinateValidator::isValidLatitude(double lat) const {
  return std::isfinite(lat) && lat >= LATITUDE_BOUNDS.min &&
         lat <= LATITUDE_BOUNDS.max;
}

bool CoordinateValidator::isValidLongitude(double lon) const {
  return std::isfinite(lon) && lon >= LONGITUDE_BOUNDS.min &&
         lon <= LONGITUDE_BOUNDS.max;
}

bool CoordinateValidator::looksSwapped(double lat, double lon) {
  return std::fabs(lat) > 90.0 && std::fabs(lat) <= 180.0 &&
         std::fabs(lon) <= 90.0;
}

// Classifies a coordinate pair. The checks run in a fixed order: missing or
// NaN input, the (0,0) placeholder, a latitude that only fits as longitude
// (swapped; repaired when autoFix is set), then plain range checks.
ValidatedCoordinates
CoordinateValidator::validateCoordinates(std::optional<double> lat,
                                         std::optional<double> lon,
                                         bool autoFix) const {
  ValidatedCoordinates result;

  if (!lat || !lon || std::isnan(*lat) || std::isnan(*lon)) {
    return result;
  }

  result.latitude = *lat;
  result.longitude = *lon;

  if (*lat == 0.0 && *lon == 0.0) {
    result.validationStatus = ValidationStatus::SUSPICIOUS_ZERO;
    result.confidence = 0.1;
    return result;
  }

  if (looksSwapped(*lat, *lon)) {
    result.validationStatus = ValidationStatus::SWAPPED;
    if (autoFix) {
      result.latitude = *lon;
      result.longitude = *lat;
      result.isValid = true;
      result.confidence = 0.8;
      result.wasSwapped = true;
    } else {
      result.confidence = 0.3;
    }
    return result;
  }

  if (!isValidLatitude(*lat) || !isValidLongitude(*lon)) {
    result.validationStatus = ValidationStatus::OUT_OF_RANGE;
    return result;
  }

  result.isValid = true;
  result.validationStatus = ValidationStatus::VALID;
  result.confidence = 1.0;
  return result;
}

CoordinateExtraction
CoordinateValidator::extractFromCombined(const FieldValue &value,
                                         CombinedFormat format) const {
  CoordinateExtraction extraction;
  extraction.format = format == CombinedFormat::AUTO
                          ? std::string("unknown")
                          : combinedFormatToString(format);

  if (value.isNull() ||
      (value.isString() && StringUtils::trim(value.asString()).empty())) {
    return extraction;
  }

  std::vector<CombinedFormat> candidates;
  if (format == CombinedFormat::AUTO) {
    candidates = {CombinedFormat::COMMA, CombinedFormat::SPACE,
                  CombinedFormat::GEOJSON, CombinedFormat::BRACKETS};
  } else {
    candidates = {format};
  }

  for (CombinedFormat candidate : candidates) {
    auto pair = FormatDetector::parseCombined(value, candidate);
    if (!pair) {
      continue;
    }
    ValidatedCoordinates validated =
        validateCoordinates(pair->first, pair->second);
    if (!validated.isValid && format == CombinedFormat::AUTO) {
      continue;
    }
    extraction.latitude = validated.latitude;
    extraction.longitude = validated.longitude;
    extraction.format = combinedFormatToString(candidate);
    extraction.isValid = validated.isValid;
    return extraction;
  }

  Logger::debug(LogCategory::GEO, "CoordinateValidator::extractFromCombined",
                "No coordinate pair in value '" + value.toDisplayString() + "'");
  return extraction;
}

bool CoordinateValidator::detectSwappedCoordinates(
    const std::vector<std::pair<std::optional<double>, std::optional<double>>>
        &samples) const {
  size_t total = 0;
  size_t swapped = 0;
  for (const auto &[lat, lon] : samples) {
    if (!lat || !lon) {
      continue;
    }
    ++total;
    if (looksSwapped(*lat, *lon)) {
      ++swapped;
    }
  }
  if (total == 0) {
    return false;
  }
  return static_cast<double>(swapped) / static_cast<double>(total) >
         SWAP_DETECTION_RATIO;
}

// Plausibility of an already range-checked pair, in [0,1]. Integer-only
// pairs, values hugging the range limits and well-known placeholder
// coordinates each lower the score multiplicatively.
double CoordinateValidator::calculateConfidence(double lat, double lon) const {
  if (!isValidLatitude(lat) || !isValidLongitude(lon)) {
    return 0.0;
  }

  double confidence = 1.0;

  if (std::floor(lat) == lat && std::floor(lon) == lon) {
    confidence *= INTEGER_PENALTY;
  }

  if (std::fabs(std::fabs(lat) - 90.0) < NEAR_BOUNDS_MARGIN ||
      std::fabs(std::fabs(lon) - 180.0) < NEAR_BOUNDS_MARGIN) {
    confidence *= NEAR_BOUNDS_PENALTY;
  }

  for (const auto &[testLat, testLon] : TEST_COORDINATES) {
    if (std::fabs(lat - testLat) < TEST_COORDINATE_TOLERANCE &&
        std::fabs(lon - testLon) < TEST_COORDINATE_TOLERANCE) {
      confidence *= TEST_COORDINATE_PENALTY;
      break;
    }
  }

  return confidence;
}
