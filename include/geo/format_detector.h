#ifndef FORMAT_DETECTOR_H
#define FORMAT_DETECTOR_H

#include "core/field_value.h"
#include "geo/geo_types.h"
#include <optional>
#include <utility>
#include <vector>

// Decides whether a single column holds combined coordinates and in which
// encoding. A format is accepted when the share of non-empty samples that
// both parse and validate reaches EngineConfig::FORMAT_CONFIDENCE_THRESHOLD.
class FormatDetector {
public:
  using LatLon = std::pair<double, double>;

  FormatDetectionResult checkCommaFormat(const std::vector<FieldValue> &samples) const;
  FormatDetectionResult checkSpaceFormat(const std::vector<FieldValue> &samples) const;
  FormatDetectionResult checkGeoJsonFormat(const std::vector<FieldValue> &samples) const;
  FormatDetectionResult checkBracketFormat(const std::vector<FieldValue> &samples) const;

  // Runs one checker, or for CombinedFormat::AUTO tries comma, space,
  // GeoJSON and bracketed list in that order and returns the first accepted
  // result.
  FormatDetectionResult detectFormat(const std::vector<FieldValue> &samples,
                                     CombinedFormat family = CombinedFormat::AUTO) const;

  // Raw (lat, lon) pair for one value in the given encoding, without range
  // validation. GeoJSON positions are stored [lon, lat] and are returned
  // reordered.
  static std::optional<LatLon> parseCombined(const FieldValue &value,
                                             CombinedFormat format);

private:
  FormatDetectionResult checkFormat(const std::vector<FieldValue> &samples,
                                    CombinedFormat format) const;
};

#endif
