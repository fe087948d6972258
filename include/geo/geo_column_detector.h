#ifndef GEO_COLUMN_DETECTOR_H
#define GEO_COLUMN_DETECTOR_H

#include "core/field_value.h"
#include "geo/format_detector.h"
#include "geo/geo_types.h"
#include <optional>
#include <regex>
#include <string>
#include <vector>

class GeoColumnDetector {
public:
  // Locates coordinate columns in a batch. Tries, in order: separate lat/lon
  // columns found by header name, a single combined column found by header
  // name, and finally a value-only heuristic over every column. The first
  // strategy that succeeds decides the result.
  GeoColumnResult detect(const std::vector<std::string> &headers,
                         const std::vector<Row> &rows) const;

  // Checks a user-chosen lat/lon pair against the data and reports it with
  // detection method "manual". found is false when validation fails.
  GeoColumnResult validateManualSelection(const std::vector<Row> &rows,
                                          const std::string &latColumn,
                                          const std::string &lonColumn) const;

  // Same for a user-chosen combined column; format AUTO lets the detector
  // pick the encoding.
  GeoColumnResult
  validateManualCombined(const std::vector<Row> &rows,
                         const std::string &column,
                         CombinedFormat format = CombinedFormat::AUTO) const;

  PairValidation validateCoordinatePairs(const std::vector<Row> &rows,
                                         const std::string &latColumn,
                                         const std::string &lonColumn) const;

private:
  std::optional<std::string>
  findColumnByPatterns(const std::vector<std::string> &headers,
                       const std::vector<std::regex> &patterns) const;

  FormatDetectionResult detectCombinedFormat(const std::vector<Row> &rows,
                                             const std::string &column,
                                             CombinedFormat format) const;

  GeoColumnResult detectByHeuristics(const std::vector<std::string> &headers,
                                     const std::vector<Row> &rows) const;

  FormatDetector formatDetector_;
};

#endif
