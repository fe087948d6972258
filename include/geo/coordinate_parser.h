#ifndef COORDINATE_PARSER_H
#define COORDINATE_PARSER_H

#include "core/field_value.h"
#include <optional>
#include <string>

namespace CoordinateParser {

// Best-effort conversion of a cell value into decimal degrees. Numbers pass
// through unchanged; strings are tried as plain decimals, then
// degrees-minutes-seconds ("40°26'46\"N"), then degrees with decimal minutes
// ("40 26.767N"), then "decimal [NSEW]". S and W make the result negative.
// Returns std::nullopt for anything unparseable; never throws.
std::optional<double> parseCoordinate(const FieldValue &value);
std::optional<double> parseCoordinate(const std::string &value);

// False when either side is missing or non-finite, |lat| > 90, |lon| > 180,
// or (when EngineConfig::REJECT_ZERO_COORDINATES is set) both are exactly 0.
bool isValidCoordinate(std::optional<double> lat, std::optional<double> lon);

bool isWithinBounds(double value, double min, double max);

} // namespace CoordinateParser

#endif
