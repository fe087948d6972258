#include "geo/coordinate_parser.h"
#include "core/engine_config.h"
#include "utils/string_utils.h"
#include <cctype>
#include <cmath>
#include <regex>

namespace CoordinateParser {

namespace {

const std::regex &decimalPattern() {
  static const std::regex pattern(R"(^-?(?:\d+(?:\.\d+)?|\.\d+)(?:[eE][+-]?\d+)?$)");
  return pattern;
}

// D° M' S" [NSEW]; degree/minute/second markers may be replaced by spaces.
const std::regex &dmsPattern() {
  static const std::regex pattern(
      R"(^(-?\d{1,3})(?:°|º|\s)\s*(\d{1,2})(?:'|′|’|\s)\s*(\d{1,2}(?:\.\d{0,6})?)(?:"|″|”|'')?\s*([NSEWnsew])?$)");
  return pattern;
}

// D° M.mmm' [NSEW]
const std::regex &decimalMinutesPattern() {
  static const std::regex pattern(
      R"(^(-?\d{1,3})(?:°|º|\s)\s*(\d{1,2}(?:\.\d{0,6})?)(?:'|′|’)?\s*([NSEWnsew])?$)");
  return pattern;
}

const std::regex &directionalPattern() {
  static const std::regex pattern(
      R"(^(-?\d{1,3}(?:\.\d{0,10})?)\s{0,2}([NSEWnsew])$)");
  return pattern;
}

bool isNegativeDirection(const std::ssub_match &direction) {
  if (!direction.matched || direction.length() == 0) {
    return false;
  }
  char c = static_cast<char>(std::toupper(static_cast<unsigned char>(direction.str()[0])));
  return c == 'S' || c == 'W';
}

double applySign(const std::string &degreesText, double magnitude,
                 const std::ssub_match &direction) {
  bool negative = (!degreesText.empty() && degreesText[0] == '-') ||
                  isNegativeDirection(direction);
  return negative ? -magnitude : magnitude;
}

bool hasAngleMarker(const std::string &text) {
  for (const char *marker : {"°", "º", "'", "′", "’"}) {
    if (text.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

std::optional<double> parseCoordinate(const std::string &value) {
  std::string trimmed = StringUtils::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  try {
    if (std::regex_match(trimmed, decimalPattern())) {
      double parsed = std::stod(trimmed);
      if (!std::isfinite(parsed)) {
        return std::nullopt;
      }
      return parsed;
    }

    std::smatch m;
    if (std::regex_match(trimmed, m, dmsPattern())) {
      double degrees = std::fabs(std::stod(m[1].str()));
      double minutes = std::stod(m[2].str());
      double seconds = std::stod(m[3].str());
      if (minutes >= 60 || seconds >= 60) {
        return std::nullopt;
      }
      return applySign(m[1].str(), degrees + minutes / 60.0 + seconds / 3600.0,
                       m[4]);
    }

    // Two bare numbers ("40 26") are too ambiguous to read as degrees and
    // minutes; require a degree or minute marker or a direction letter.
    if (std::regex_match(trimmed, m, decimalMinutesPattern()) &&
        (m[3].matched || hasAngleMarker(trimmed))) {
      double degrees = std::fabs(std::stod(m[1].str()));
      double minutes = std::stod(m[2].str());
      if (minutes >= 60) {
        return std::nullopt;
      }
      return applySign(m[1].str(), degrees + minutes / 60.0, m[3]);
    }

    if (std::regex_match(trimmed, m, directionalPattern())) {
      double magnitude = std::fabs(std::stod(m[1].str()));
      return isNegativeDirection(m[2]) ? -magnitude : magnitude;
    }
  } catch (const std::out_of_range &) {
    return std::nullopt;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  }

  return std::nullopt;
}

std::optional<double> parseCoordinate(const FieldValue &value) {
  switch (value.kind()) {
  case FieldValue::Kind::INTEGER:
  case FieldValue::Kind::FLOAT: {
    double number = value.asDouble();
    if (!std::isfinite(number)) {
      return std::nullopt;
    }
    return number;
  }
  case FieldValue::Kind::STRING:
    return parseCoordinate(value.asString());
  default:
    return std::nullopt;
  }
}

bool isValidCoordinate(std::optional<double> lat, std::optional<double> lon) {
  if (!lat || !lon || !std::isfinite(*lat) || !std::isfinite(*lon)) {
    return false;
  }
  if (std::fabs(*lat) > 90.0 || std::fabs(*lon) > 180.0) {
    return false;
  }
  if (EngineConfig::getRejectZeroCoordinates() && *lat == 0.0 &&
      *lon == 0.0) {
    return false;
  }
  return true;
}

bool isWithinBounds(double value, double min, double max) {
  return std::isfinite(value) && value >= min && value <= max;
}

} // namespace CoordinateParser
