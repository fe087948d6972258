#include "geo/format_detector.h"
#include "core/engine_config.h"
#include "core/logger.h"
#include "geo/coordinate_parser.h"
#include "utils/string_utils.h"
#include <regex>

namespace {

const std::regex &commaPattern() {
  static const std::regex pattern(
      R"(^(-?\d{1,3}\.?\d{0,10}),\s{0,5}(-?\d{1,3}\.?\d{0,10})$)");
  return pattern;
}

const std::regex &spacePattern() {
  static const std::regex pattern(
      R"(^(-?\d{1,3}\.?\d{0,10})\s{1,5}(-?\d{1,3}\.?\d{0,10})$)");
  return pattern;
}

const std::regex &bracketPattern() {
  static const std::regex pattern(
      R"(^\[\s*(-?\d{1,3}(?:\.\d+)?)\s*,\s*(-?\d{1,3}(?:\.\d+)?)\s*\]$)");
  return pattern;
}

std::optional<FormatDetector::LatLon> matchPair(const std::string &text,
                                                const std::regex &pattern) {
  std::smatch m;
  if (!std::regex_match(text, m, pattern)) {
    return std::nullopt;
  }
  // The patterns only admit short signed decimals, so stod cannot fail.
  return FormatDetector::LatLon{std::stod(m[1].str()), std::stod(m[2].str())};
}

std::optional<FormatDetector::LatLon> parseGeoJsonPoint(const FieldValue &value) {
  ordered_json document;
  if (value.kind() == FieldValue::Kind::OBJECT) {
    document = value.asJson();
  } else if (value.isString()) {
    std::string text = StringUtils::trim(value.asString());
    if (text.empty() || text.front() != '{') {
      return std::nullopt;
    }
    document = ordered_json::parse(text, nullptr, false);
    if (document.is_discarded()) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }

  if (!document.is_object() || !document.contains("type") ||
      document["type"] != "Point" || !document.contains("coordinates")) {
    return std::nullopt;
  }
  const auto &coordinates = document["coordinates"];
  if (!coordinates.is_array() || coordinates.size() < 2 ||
      !coordinates[0].is_number() || !coordinates[1].is_number()) {
    return std::nullopt;
  }
  return FormatDetector::LatLon{coordinates[1].get<double>(),
                                coordinates[0].get<double>()};
}

bool isEmptySample(const FieldValue &value) {
  if (value.isNull()) {
    return true;
  }
  return value.isString() && StringUtils::trim(value.asString()).empty();
}

} // namespace

std::optional<FormatDetector::LatLon>
FormatDetector::parseCombined(const FieldValue &value, CombinedFormat format) {
  switch (format) {
  case CombinedFormat::COMMA:
    return matchPair(StringUtils::trim(value.toDisplayString()), commaPattern());
  case CombinedFormat::SPACE:
    return matchPair(StringUtils::trim(value.toDisplayString()), spacePattern());
  case CombinedFormat::GEOJSON:
    return parseGeoJsonPoint(value);
  case CombinedFormat::BRACKETS:
    if (value.kind() == FieldValue::Kind::ARRAY) {
      const auto &items = value.asJson();
      if (items.size() == 2 && items[0].is_number() && items[1].is_number()) {
        return LatLon{items[0].get<double>(), items[1].get<double>()};
      }
      return std::nullopt;
    }
    return matchPair(StringUtils::trim(value.toDisplayString()), bracketPattern());
  case CombinedFormat::AUTO:
    for (CombinedFormat candidate :
         {CombinedFormat::COMMA, CombinedFormat::SPACE, CombinedFormat::GEOJSON,
          CombinedFormat::BRACKETS}) {
      if (auto pair = parseCombined(value, candidate)) {
        return pair;
      }
    }
    return std::nullopt;
  }
  return std::nullopt;
}

FormatDetectionResult
FormatDetector::checkFormat(const std::vector<FieldValue> &samples,
                            CombinedFormat format) const {
  FormatDetectionResult result;
  result.format = combinedFormatToString(format);

  size_t nonEmpty = 0;
  size_t matches = 0;
  for (const auto &sample : samples) {
    if (isEmptySample(sample)) {
      continue;
    }
    ++nonEmpty;
    auto pair = parseCombined(sample, format);
    if (pair && CoordinateParser::isValidCoordinate(pair->first, pair->second)) {
      ++matches;
    }
  }

  if (nonEmpty == 0) {
    return result;
  }

  result.confidence = static_cast<double>(matches) / static_cast<double>(nonEmpty);
  result.isValid =
      result.confidence >= EngineConfig::getFormatConfidenceThreshold();
  return result;
}

FormatDetectionResult
FormatDetector::checkCommaFormat(const std::vector<FieldValue> &samples) const {
  return checkFormat(samples, CombinedFormat::COMMA);
}

FormatDetectionResult
FormatDetector::checkSpaceFormat(const std::vector<FieldValue> &samples) const {
  return checkFormat(samples, CombinedFormat::SPACE);
}

FormatDetectionResult
FormatDetector::checkGeoJsonFormat(const std::vector<FieldValue> &samples) const {
  return checkFormat(samples, CombinedFormat::GEOJSON);
}

FormatDetectionResult
FormatDetector::checkBracketFormat(const std::vector<FieldValue> &samples) const {
  return checkFormat(samples, CombinedFormat::BRACKETS);
}

FormatDetectionResult
FormatDetector::detectFormat(const std::vector<FieldValue> &samples,
                             CombinedFormat family) const {
  if (family != CombinedFormat::AUTO) {
    return checkFormat(samples, family);
  }

  for (CombinedFormat candidate :
       {CombinedFormat::COMMA, CombinedFormat::SPACE, CombinedFormat::GEOJSON,
        CombinedFormat::BRACKETS}) {
    FormatDetectionResult result = checkFormat(samples, candidate);
    if (result.isValid) {
      Logger::debug(LogCategory::GEO, "FormatDetector::detectFormat",
                    "Detected " + result.format + " with confidence " +
                        std::to_string(result.confidence));
      return result;
    }
  }

  return FormatDetectionResult{};
}
