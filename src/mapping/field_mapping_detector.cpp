#include "mapping/field_mapping_detector.h"
#include "core/logger.h"
#include "geo/geo_column_detector.h"
#include "mapping/language_support.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <regex>
#include <set>

namespace {

constexpr double PATTERN_WEIGHT = 0.6;
constexpr double VALIDATION_WEIGHT = 0.4;
constexpr double NO_SAMPLE_SCORE = 0.5;
constexpr double MIN_GEO_CONFIDENCE = 0.5;
constexpr size_t DATE_PARSE_SAMPLES = 10;

// Mean code-point length of the string samples, or nullopt when there are
// samples but none of them is a string.
struct LengthProbe {
  bool hasSamples = false;
  std::optional<double> averageLength;
};

LengthProbe probeLength(const FieldStatistics &stats) {
  LengthProbe probe;
  probe.hasSamples = !stats.uniqueSamples.empty();
  size_t total = 0;
  size_t strings = 0;
  for (const auto &sample : stats.uniqueSamples) {
    if (sample.isString()) {
      total += StringUtils::utf8Length(sample.asString());
      ++strings;
    }
  }
  if (strings > 0) {
    probe.averageLength = static_cast<double>(total) / static_cast<double>(strings);
  }
  return probe;
}

double stringShare(const FieldStatistics &stats) {
  if (stats.occurrences == 0) {
    return 0.0;
  }
  return static_cast<double>(stats.typeCount("string")) /
         static_cast<double>(stats.occurrences);
}

double titleLengthScore(double avg) {
  if (avg >= 10.0 && avg <= 100.0) {
    return 1.0;
  }
  if (avg >= 3.0 && avg < 10.0) {
    return (avg - 3.0) / 7.0;
  }
  if (avg > 100.0 && avg <= 500.0) {
    return (500.0 - avg) / 400.0;
  }
  return 0.0;
}

double descriptionLengthScore(double avg) {
  if (avg >= 20.0 && avg <= 500.0) {
    return 1.0;
  }
  if (avg >= 10.0 && avg <= 1000.0) {
    return 0.8;
  }
  if (avg < 5.0) {
    return 0.2;
  }
  if (avg > 1000.0) {
    return 0.7;
  }
  return 0.6;
}

double locationNameLengthScore(double avg) {
  if (avg >= 3.0 && avg <= 50.0) {
    return 1.0;
  }
  if (avg >= 2.0 && avg <= 100.0) {
    return 0.8;
  }
  if (avg < 2.0) {
    return 0.2;
  }
  return 0.6;
}

double locationLengthScore(double avg) {
  if (avg >= 3.0 && avg <= 100.0) {
    return 1.0;
  }
  if (avg >= 2.0 && avg <= 500.0) {
    return 0.8;
  }
  if (avg < 2.0) {
    return 0.2;
  }
  return 0.6;
}

double validateTextField(const FieldStatistics &stats, double minStringShare,
                         double (*lengthScore)(double)) {
  if (stringShare(stats) < minStringShare) {
    return 0.0;
  }
  LengthProbe probe = probeLength(stats);
  if (!probe.hasSamples) {
    return NO_SAMPLE_SCORE;
  }
  if (!probe.averageLength) {
    return 0.0;
  }
  return lengthScore(*probe.averageLength);
}

const std::regex &isoDateTimePrefix() {
  static const std::regex pattern(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})");
  return pattern;
}

double checkDateValues(const FieldStatistics &stats) {
  if (stats.occurrences == 0 || stats.uniqueSamples.empty()) {
    return 0.0;
  }
  const double dateShare = static_cast<double>(stats.typeCount("date")) /
                           static_cast<double>(stats.occurrences);
  if (dateShare < 0.7) {
    return 0.0;
  }
  size_t dateLike = 0;
  for (const auto &sample : stats.uniqueSamples) {
    if (sample.kind() == FieldValue::Kind::DATE ||
        (sample.isString() && std::regex_search(sample.asString(), isoDateTimePrefix()))) {
      ++dateLike;
    }
  }
  const double share =
      static_cast<double>(dateLike) / static_cast<double>(stats.uniqueSamples.size());
  if (share >= 0.7) {
    return 0.8 + 0.2 * (share - 0.7) / 0.3;
  }
  if (share >= 0.5) {
    return 0.8;
  }
  return 0.0;
}

double checkDateFormats(const FieldStatistics &stats) {
  auto count = [&](const char *tag) -> size_t {
    auto it = stats.formats.find(tag);
    return it == stats.formats.end() ? 0 : it->second;
  };
  const size_t dated = count("date") + count("dateTime");
  if (dated == 0 || stats.occurrences == 0) {
    return 0.0;
  }
  const double coverage =
      static_cast<double>(dated) / static_cast<double>(stats.occurrences);
  return std::min(1.0, 0.7 + 0.3 * coverage);
}

// Text that already parsed as a date at ingestion is tagged "date" and
// still counts as a sampled string here.
double checkParseableStrings(const FieldStatistics &stats) {
  const double textShare =
      stringShare(stats) + static_cast<double>(stats.typeCount("date")) /
                               static_cast<double>(std::max<size_t>(stats.occurrences, 1));
  if (textShare <= 0.5) {
    return 0.0;
  }
  size_t checked = 0;
  size_t parsed = 0;
  for (const auto &sample : stats.uniqueSamples) {
    if (checked >= DATE_PARSE_SAMPLES) {
      break;
    }
    if (!sample.isString()) {
      continue;
    }
    ++checked;
    if (TimeUtils::parseDate(sample.asString())) {
      ++parsed;
    }
  }
  if (checked == 0) {
    return 0.0;
  }
  const double hitRate = static_cast<double>(parsed) / static_cast<double>(checked);
  if (hitRate < 0.5) {
    return 0.0;
  }
  return 0.5 + 0.4 * (hitRate - 0.5) / 0.5;
}

double checkEpochRange(const FieldStatistics &stats) {
  const bool numeric = stats.typeCount("number") > 0 || stats.typeCount("integer") > 0;
  if (!numeric || !stats.numericStats) {
    return 0.0;
  }
  const double min = stats.numericStats->min;
  const double max = stats.numericStats->max;
  if (min > 1e9 && max < 9999999999.0) {
    return 0.8;
  }
  if (min > 1e12 && max < 9999999999999.0) {
    return 0.8;
  }
  return 0.0;
}

std::vector<std::string> collectHeaders(const std::vector<Row> &rows) {
  std::vector<std::string> headers;
  std::set<std::string> seen;
  for (const auto &row : rows) {
    for (const auto &[column, value] : row) {
      if (seen.insert(column).second) {
        headers.push_back(column);
      }
    }
  }
  return headers;
}

void putPath(ordered_json &out, const char *key, const std::optional<std::string> &path) {
  out[key] = path ? ordered_json(*path) : ordered_json(nullptr);
}

} // namespace

ordered_json FieldMappings::toJson() const {
  ordered_json out = ordered_json::object();
  putPath(out, "titlePath", titlePath);
  putPath(out, "descriptionPath", descriptionPath);
  putPath(out, "locationNamePath", locationNamePath);
  putPath(out, "timestampPath", timestampPath);
  putPath(out, "latitudePath", latitudePath);
  putPath(out, "longitudePath", longitudePath);
  putPath(out, "locationPath", locationPath);
  return out;
}

ordered_json FieldMappingResult::toJson() const {
  ordered_json out;
  out["language"] = language;
  out["mappings"] = mappings.toJson();
  out["confidence"] = ordered_json::object();
  for (const auto &[role, score] : confidence) {
    out["confidence"][role] = score;
  }
  out["geo"] = geo ? ordered_json(geo->toJson()) : ordered_json(nullptr);
  return out;
}

FieldMappingDetector::FieldMappingDetector(const FieldPatternTable &patterns)
    : patterns_(patterns) {}

double FieldMappingDetector::validateFieldType(const FieldStatistics &stats,
                                               FieldRole role) {
  if (stats.occurrences == 0) {
    return 0.0;
  }
  switch (role) {
  case FieldRole::TITLE:
    return validateTextField(stats, 0.8, titleLengthScore);
  case FieldRole::DESCRIPTION:
    return validateTextField(stats, 0.7, descriptionLengthScore);
  case FieldRole::LOCATION_NAME:
    return validateTextField(stats, 0.7, locationNameLengthScore);
  case FieldRole::LOCATION:
    return validateTextField(stats, 0.7, locationLengthScore);
  case FieldRole::TIMESTAMP:
    return validateTimestampField(stats);
  }
  return 0.0;
}

// First positive check wins: typed dates, ISO format counters, strings the
// lenient date parser accepts, then epoch seconds or milliseconds.
double FieldMappingDetector::validateTimestampField(const FieldStatistics &stats) {
  if (stats.occurrences == 0) {
    return 0.0;
  }
  if (double score = checkDateValues(stats); score > 0.0) {
    return score;
  }
  if (double score = checkDateFormats(stats); score > 0.0) {
    return score;
  }
  if (double score = checkParseableStrings(stats); score > 0.0) {
    return score;
  }
  return checkEpochRange(stats);
}

std::optional<ScoredField>
FieldMappingDetector::findBestMatch(const FieldStatsMap &stats,
                                    const std::vector<std::regex> &patterns,
                                    FieldRole role) const {
  std::optional<ScoredField> best;
  for (const auto &field : stats) {
    const int index = FieldPatternTable::matchIndex(
        patterns, StringUtils::terminalSegment(field.path));
    if (index < 0) {
      continue;
    }
    const double validation = validateFieldType(field, role);
    if (validation <= 0.0) {
      continue;
    }
    const double patternScore =
        1.0 - static_cast<double>(index) / static_cast<double>(patterns.size());
    const double score = PATTERN_WEIGHT * patternScore + VALIDATION_WEIGHT * validation;
    if (!best || score > best->confidence) {
      best = ScoredField{field.path, score};
    }
  }
  return best;
}

std::optional<ScoredField>
FieldMappingDetector::detectField(const FieldStatsMap &stats, FieldRole role,
                                  const std::string &language) const {
  const std::string english = LanguageSupport::DEFAULT_LANGUAGE;
  const std::vector<std::regex> *primary = patterns_.patterns(role, language);
  if (primary == nullptr) {
    primary = patterns_.patterns(role, english);
  }
  if (primary == nullptr) {
    return std::nullopt;
  }

  std::optional<ScoredField> best = findBestMatch(stats, *primary, role);
  if (!best && language != english) {
    if (const auto *fallback = patterns_.patterns(role, english)) {
      best = findBestMatch(stats, *fallback, role);
    }
  }
  return best;
}

FieldMappingResult
FieldMappingDetector::detectFieldMappings(const FieldStatsMap &stats,
                                          const std::string &language,
                                          const std::vector<Row> &sampleRows) const {
  FieldMappingResult result;
  result.language = language;

  auto assign = [&](FieldRole role, std::optional<std::string> &target) {
    if (auto match = detectField(stats, role, language)) {
      target = match->path;
      result.confidence[fieldRoleToString(role)] = match->confidence;
    }
  };

  assign(FieldRole::TITLE, result.mappings.titlePath);
  assign(FieldRole::DESCRIPTION, result.mappings.descriptionPath);
  assign(FieldRole::LOCATION_NAME, result.mappings.locationNamePath);
  assign(FieldRole::TIMESTAMP, result.mappings.timestampPath);
  assign(FieldRole::LOCATION, result.mappings.locationPath);

  bool coordinatesFromRows = false;
  if (!sampleRows.empty()) {
    GeoColumnDetector geoDetector;
    GeoColumnResult geo = geoDetector.detect(collectHeaders(sampleRows), sampleRows);
    if (geo.found) {
      result.geo = geo;
    }
    if (geo.found && geo.type == GeoColumnType::SEPARATE &&
        geo.confidence >= MIN_GEO_CONFIDENCE) {
      // A swapped pair holds longitudes under the latitude name.
      result.mappings.latitudePath =
          geo.swappedCoordinates ? geo.lonColumn : geo.latColumn;
      result.mappings.longitudePath =
          geo.swappedCoordinates ? geo.latColumn : geo.lonColumn;
      result.confidence["latitude"] = geo.confidence;
      result.confidence["longitude"] = geo.confidence;
      coordinatesFromRows = true;
    }
    if (geo.found && geo.type == GeoColumnType::COMBINED &&
        !result.mappings.locationPath) {
      result.mappings.locationPath = geo.combinedColumn;
      result.confidence["location"] = geo.confidence;
    }
  }

  if (!coordinatesFromRows) {
    if (auto lat = coordinateScorer_.findCoordinateField(stats, CoordinateAxis::LATITUDE)) {
      result.mappings.latitudePath = lat->path;
      result.confidence["latitude"] = lat->confidence;
    }
    if (auto lon = coordinateScorer_.findCoordinateField(stats, CoordinateAxis::LONGITUDE)) {
      result.mappings.longitudePath = lon->path;
      result.confidence["longitude"] = lon->confidence;
    }
  }

  Logger::info(LogCategory::MAPPING, "FieldMappingDetector::detectFieldMappings",
               "Detected " + std::to_string(result.confidence.size()) +
                   " field roles over " + std::to_string(stats.size()) +
                   " fields (language " + language + ")");
  return result;
}
