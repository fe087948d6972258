#include "geo/geo_types.h"
#include <stdexcept>

json ValidatedCoordinates::toJson() const {
  json result = {{"latitude", latitude},
                 {"longitude", longitude},
                 {"isValid", isValid},
                 {"validationStatus", validationStatusToString(validationStatus)},
                 {"confidence", confidence}};
  if (wasSwapped) {
    result["wasSwapped"] = true;
  }
  return result;
}

json CoordinateExtraction::toJson() const {
  json result = {{"format", format}, {"isValid", isValid}};
  result["latitude"] = latitude ? json(*latitude) : json(nullptr);
  result["longitude"] = longitude ? json(*longitude) : json(nullptr);
  return result;
}

json GeoColumnResult::toJson() const {
  json result = {{"found", found},
                 {"type", geoColumnTypeToString(type)},
                 {"confidence", confidence}};
  if (latColumn)
    result["latColumn"] = *latColumn;
  if (lonColumn)
    result["lonColumn"] = *lonColumn;
  if (combinedColumn)
    result["combinedColumn"] = *combinedColumn;
  if (format)
    result["format"] = *format;
  if (detectionMethod)
    result["detectionMethod"] = detectionMethodToString(*detectionMethod);
  if (type == GeoColumnType::SEPARATE)
    result["swappedCoordinates"] = swappedCoordinates;
  return result;
}

std::string validationStatusToString(ValidationStatus status) {
  switch (status) {
  case ValidationStatus::VALID:
    return "valid";
  case ValidationStatus::OUT_OF_RANGE:
    return "out_of_range";
  case ValidationStatus::SUSPICIOUS_ZERO:
    return "suspicious_zero";
  case ValidationStatus::SWAPPED:
    return "swapped";
  case ValidationStatus::INVALID:
    return "invalid";
  }
  return "invalid";
}

std::string combinedFormatToString(CombinedFormat format) {
  switch (format) {
  case CombinedFormat::COMMA:
    return "combined_comma";
  case CombinedFormat::SPACE:
    return "combined_space";
  case CombinedFormat::GEOJSON:
    return "geojson";
  case CombinedFormat::BRACKETS:
    return "brackets";
  case CombinedFormat::AUTO:
    return "auto";
  }
  return "auto";
}

CombinedFormat combinedFormatFromString(const std::string &format) {
  if (format == "combined_comma")
    return CombinedFormat::COMMA;
  if (format == "combined_space")
    return CombinedFormat::SPACE;
  if (format == "geojson")
    return CombinedFormat::GEOJSON;
  if (format == "brackets")
    return CombinedFormat::BRACKETS;
  if (format == "auto")
    return CombinedFormat::AUTO;
  throw std::invalid_argument("Unknown combined coordinate format: " + format);
}

std::string geoColumnTypeToString(GeoColumnType type) {
  switch (type) {
  case GeoColumnType::SEPARATE:
    return "separate";
  case GeoColumnType::COMBINED:
    return "combined";
  case GeoColumnType::NONE:
    return "none";
  }
  return "none";
}

std::string detectionMethodToString(DetectionMethod method) {
  switch (method) {
  case DetectionMethod::PATTERN:
    return "pattern";
  case DetectionMethod::HEURISTIC:
    return "heuristic";
  case DetectionMethod::MANUAL:
    return "manual";
  }
  return "pattern";
}
