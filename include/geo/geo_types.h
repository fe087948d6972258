#ifndef GEO_TYPES_H
#define GEO_TYPES_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

enum class ValidationStatus {
  VALID,
  OUT_OF_RANGE,
  SUSPICIOUS_ZERO,
  SWAPPED,
  INVALID
};

enum class CombinedFormat { COMMA, SPACE, GEOJSON, BRACKETS, AUTO };

enum class GeoColumnType { SEPARATE, COMBINED, NONE };

enum class DetectionMethod { PATTERN, HEURISTIC, MANUAL };

struct CoordinateBounds {
  double min;
  double max;
};

constexpr CoordinateBounds LATITUDE_BOUNDS{-90.0, 90.0};
constexpr CoordinateBounds LONGITUDE_BOUNDS{-180.0, 180.0};

struct ValidatedCoordinates {
  double latitude = 0.0;
  double longitude = 0.0;
  bool isValid = false;
  ValidationStatus validationStatus = ValidationStatus::INVALID;
  double confidence = 0.0;
  bool wasSwapped = false;

  json toJson() const;
};

struct CoordinateExtraction {
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::string format = "unknown";
  bool isValid = false;

  json toJson() const;
};

struct FormatDetectionResult {
  bool isValid = false;
  std::string format = "unknown";
  double confidence = 0.0;
};

struct PairValidation {
  bool isValid = false;
  double confidence = 0.0;
  bool swapped = false;
};

struct GeoColumnResult {
  bool found = false;
  GeoColumnType type = GeoColumnType::NONE;
  std::optional<std::string> latColumn;
  std::optional<std::string> lonColumn;
  std::optional<std::string> combinedColumn;
  std::optional<std::string> format;
  double confidence = 0.0;
  std::optional<DetectionMethod> detectionMethod;
  bool swappedCoordinates = false;

  json toJson() const;
};

std::string validationStatusToString(ValidationStatus status);
std::string combinedFormatToString(CombinedFormat format);
CombinedFormat combinedFormatFromString(const std::string &format);
std::string geoColumnTypeToString(GeoColumnType type);
std::string detectionMethodToString(DetectionMethod method);

#endif
