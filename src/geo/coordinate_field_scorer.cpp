#include "geo/coordinate_field_scorer.h"
#include "geo/coordinate_parser.h"
#include "geo/geo_patterns.h"
#include "utils/string_utils.h"
#include <algorithm>

namespace {

constexpr double PATTERN_WEIGHT = 0.4;
constexpr double TYPE_WEIGHT = 0.3;
constexpr double CONSISTENCY_WEIGHT = 0.2;
constexpr double COMPLETENESS_WEIGHT = 0.1;

bool hasNumericType(const FieldStatistics &stats) {
  return stats.typeCount("number") > 0 || stats.typeCount("integer") > 0;
}

bool numericInBounds(const FieldStatistics &stats, const CoordinateBounds &bounds) {
  return stats.numericStats && stats.numericStats->min >= bounds.min &&
         stats.numericStats->max <= bounds.max;
}

struct StringSampleScan {
  size_t nonEmpty = 0;
  size_t parsed = 0;
  size_t inBounds = 0;
};

StringSampleScan scanStringSamples(const FieldStatistics &stats,
                                   const CoordinateBounds &bounds,
                                   size_t limit) {
  StringSampleScan scan;
  const size_t count = std::min(stats.uniqueSamples.size(), limit);
  for (size_t i = 0; i < count; ++i) {
    const FieldValue &sample = stats.uniqueSamples[i];
    if (!sample.isString() || StringUtils::trim(sample.asString()).empty()) {
      continue;
    }
    ++scan.nonEmpty;
    auto value = CoordinateParser::parseCoordinate(sample.asString());
    if (!value) {
      continue;
    }
    ++scan.parsed;
    if (CoordinateParser::isWithinBounds(*value, bounds.min, bounds.max)) {
      ++scan.inBounds;
    }
  }
  return scan;
}

} // namespace

bool CoordinateFieldScorer::isValidCoordinateField(
    const FieldStatistics &stats, const CoordinateBounds &bounds) const {
  if (hasNumericType(stats) && numericInBounds(stats, bounds)) {
    return true;
  }
  if (stats.typeCount("string") == 0 || stats.uniqueSamples.empty()) {
    return false;
  }
  StringSampleScan scan = scanStringSamples(stats, bounds, STRING_SAMPLE_LIMIT);
  return scan.parsed > 0 &&
         static_cast<double>(scan.inBounds) / static_cast<double>(scan.parsed) >=
             STRING_IN_BOUNDS_RATIO;
}

double CoordinateFieldScorer::calculateFieldConfidence(
    const FieldStatistics &stats, const std::vector<std::regex> &patterns,
    const CoordinateBounds &bounds) const {
  if (stats.occurrences == 0) {
    return 0.0;
  }

  double confidence = 0.0;

  const int index =
      GeoPatterns::findPatternIndex(patterns, StringUtils::terminalSegment(stats.path));
  if (index >= 0 && !patterns.empty()) {
    confidence += PATTERN_WEIGHT * (1.0 - static_cast<double>(index) /
                                              static_cast<double>(patterns.size()));
  }

  if (hasNumericType(stats) && stats.numericStats) {
    confidence += numericInBounds(stats, bounds) ? TYPE_WEIGHT : 0.0;
  } else if (stats.typeCount("string") > 0) {
    StringSampleScan scan = scanStringSamples(stats, bounds, STRING_SAMPLE_LIMIT);
    if (scan.nonEmpty > 0) {
      confidence += TYPE_WEIGHT * static_cast<double>(scan.inBounds) /
                    static_cast<double>(scan.nonEmpty);
    }
  }

  size_t total = 0;
  size_t dominant = 0;
  for (const auto &[tag, count] : stats.typeDistribution) {
    total += count;
    dominant = std::max(dominant, count);
  }
  if (total > 0) {
    confidence += CONSISTENCY_WEIGHT * static_cast<double>(dominant) /
                  static_cast<double>(total);
  }

  confidence += COMPLETENESS_WEIGHT * static_cast<double>(stats.nonNullCount()) /
                static_cast<double>(stats.occurrences);
  return confidence;
}

std::optional<ScoredField>
CoordinateFieldScorer::findCoordinateField(const FieldStatsMap &stats,
                                           CoordinateAxis axis) const {
  const auto &patterns = axis == CoordinateAxis::LATITUDE
                             ? GeoPatterns::latitudePatterns()
                             : GeoPatterns::longitudePatterns();
  const CoordinateBounds &bounds =
      axis == CoordinateAxis::LATITUDE ? LATITUDE_BOUNDS : LONGITUDE_BOUNDS;

  std::optional<ScoredField> best;
  for (const auto &field : stats) {
    if (!GeoPatterns::matchesAny(patterns, StringUtils::terminalSegment(field.path)) ||
        !isValidCoordinateField(field, bounds)) {
      continue;
    }
    const double confidence = calculateFieldConfidence(field, patterns, bounds);
    if (!best || confidence > best->confidence) {
      best = ScoredField{field.path, confidence};
    }
  }
  return best;
}
