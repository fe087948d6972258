#ifndef FIELD_MAPPING_DETECTOR_H
#define FIELD_MAPPING_DETECTOR_H

#include "core/field_value.h"
#include "geo/coordinate_field_scorer.h"
#include "geo/geo_types.h"
#include "mapping/field_patterns.h"
#include "schema/field_statistics.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct FieldMappings {
  std::optional<std::string> titlePath;
  std::optional<std::string> descriptionPath;
  std::optional<std::string> locationNamePath;
  std::optional<std::string> timestampPath;
  std::optional<std::string> latitudePath;
  std::optional<std::string> longitudePath;
  std::optional<std::string> locationPath;

  ordered_json toJson() const;
};

struct FieldMappingResult {
  FieldMappings mappings;
  std::string language;
  // Score in [0,1] for each role that was assigned, keyed by the role name
  // used in toJson ("title", "latitude", ...).
  std::map<std::string, double> confidence;
  std::optional<GeoColumnResult> geo;

  ordered_json toJson() const;
};

class FieldMappingDetector {
public:
  explicit FieldMappingDetector(
      const FieldPatternTable &patterns = FieldPatternTable::builtin());

  // Assigns semantic roles to columns. sampleRows, when given, let the
  // geo-column detector validate coordinate pairs on real values; without
  // them coordinates are chosen from statistics alone.
  FieldMappingResult
  detectFieldMappings(const FieldStatsMap &stats, const std::string &language,
                      const std::vector<Row> &sampleRows = {}) const;

  // Best column for one role; falls back to English patterns when the
  // language has no table or nothing in it matched.
  std::optional<ScoredField> detectField(const FieldStatsMap &stats, FieldRole role,
                                         const std::string &language) const;

  // Content-shape score in [0,1]; 0 means the column cannot fill the role.
  static double validateFieldType(const FieldStatistics &stats, FieldRole role);
  static double validateTimestampField(const FieldStatistics &stats);

private:
  std::optional<ScoredField> findBestMatch(const FieldStatsMap &stats,
                                           const std::vector<std::regex> &patterns,
                                           FieldRole role) const;

  const FieldPatternTable &patterns_;
  CoordinateFieldScorer coordinateScorer_;
};

#endif
