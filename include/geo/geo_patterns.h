#ifndef GEO_PATTERNS_H
#define GEO_PATTERNS_H

#include <regex>
#include <string>
#include <vector>

// Column-name patterns for coordinate detection. Each list is ordered from
// most to least specific; all patterns are anchored and case-insensitive.
// The lists are built on first use and never modified afterwards.
namespace GeoPatterns {

const std::vector<std::regex> &latitudePatterns();
const std::vector<std::regex> &longitudePatterns();
const std::vector<std::regex> &combinedPatterns();

// Index of the first pattern matching name, or -1.
int findPatternIndex(const std::vector<std::regex> &patterns,
                     const std::string &name);

bool matchesAny(const std::vector<std::regex> &patterns,
                const std::string &name);

} // namespace GeoPatterns

#endif
