#ifndef COORDINATE_VALIDATOR_H
#define COORDINATE_VALIDATOR_H

#include "core/field_value.h"
#include "geo/geo_types.h"
#include <optional>
#include <utility>
#include <vector>

class CoordinateValidator {
public:
  ValidatedCoordinates validateCoordinates(std::optional<double> lat,
                                           std::optional<double> lon,
                                           bool autoFix = true) const;

  CoordinateExtraction extractFromCombined(const FieldValue &value,
                                           CombinedFormat format) const;

  bool detectSwappedCoordinates(
      const std::vector<std::pair<std::optional<double>, std::optional<double>>>
          &samples) const;

  double calculateConfidence(double lat, double lon) const;

  bool isValidLatitude(double lat) const;
  bool isValidLongitude(double lon) const;

private:
  static bool looksSwapped(double lat, double lon);
};

#endif
