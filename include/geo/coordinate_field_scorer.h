#ifndef COORDINATE_FIELD_SCORER_H
#define COORDINATE_FIELD_SCORER_H

#include "geo/geo_types.h"
#include "schema/field_statistics.h"
#include <optional>
#include <regex>
#include <string>
#include <vector>

enum class CoordinateAxis { LATITUDE, LONGITUDE };

struct ScoredField {
  std::string path;
  double confidence = 0.0;
};

// Picks latitude and longitude columns from accumulated statistics alone,
// without looking at rows. A candidate's terminal name must match the
// axis patterns and its values must sit inside the axis bounds.
class CoordinateFieldScorer {
public:
  std::optional<ScoredField> findCoordinateField(const FieldStatsMap &stats,
                                                 CoordinateAxis axis) const;

  bool isValidCoordinateField(const FieldStatistics &stats,
                              const CoordinateBounds &bounds) const;

  // Sum of pattern (0.4), type (0.3), consistency (0.2) and completeness
  // (0.1) terms.
  double calculateFieldConfidence(const FieldStatistics &stats,
                                  const std::vector<std::regex> &patterns,
                                  const CoordinateBounds &bounds) const;

private:
  static constexpr size_t STRING_SAMPLE_LIMIT = 10;
  static constexpr double STRING_IN_BOUNDS_RATIO = 0.7;
};

#endif
