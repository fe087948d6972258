#include "geo/geo_patterns.h"
#include <initializer_list>

namespace GeoPatterns {

namespace {

std::vector<std::regex> compile(std::initializer_list<const char *> sources) {
  std::vector<std::regex> patterns;
  patterns.reserve(sources.size());
  for (const char *source : sources) {
    patterns.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
  }
  return patterns;
}

} // namespace

const std::vector<std::regex> &latitudePatterns() {
  static const std::vector<std::regex> patterns = compile({
      R"(^lat(itude)?$)",
      R"(^lat[_\s.-]?deg(rees)?$)",
      R"(^y[_\s.-]?coord(inate)?$)",
      R"(^location[_\s.-]?lat(itude)?$)",
      R"(^geo[_\s.-]?lat(itude)?$)",
      R"(^decimal[_\s.-]?lat(itude)?$)",
      R"(^latitude[_\s.-]?decimal$)",
      R"(^wgs84[_\s.-]?lat(itude)?$)",
      R"(^breite$)",
      R"(^breitengrad$)",
  });
  return patterns;
}

const std::vector<std::regex> &longitudePatterns() {
  static const std::vector<std::regex> patterns = compile({
      R"(^lon(g|gitude)?$)",
      R"(^lng$)",
      R"(^lon[_\s.-]?deg(rees)?$)",
      R"(^long[_\s.-]?deg(rees)?$)",
      R"(^x[_\s.-]?coord(inate)?$)",
      R"(^location[_\s.-]?lon(g|gitude)?$)",
      R"(^geo[_\s.-]?lon(g|gitude)?$)",
      R"(^decimal[_\s.-]?lon(g|gitude)?$)",
      R"(^longitude[_\s.-]?decimal$)",
      R"(^wgs84[_\s.-]?lon(g|gitude)?$)",
      R"(^länge$)",
      R"(^laenge$)",
      R"(^längengrad$)",
  });
  return patterns;
}

const std::vector<std::regex> &combinedPatterns() {
  static const std::vector<std::regex> patterns = compile({
      R"(^coord(inate)?s?$)",
      R"(^lat[_\s.-]?lon(g)?$)",
      R"(^location$)",
      R"(^geo[_\s.-]?location$)",
      R"(^position$)",
      R"(^point$)",
      R"(^geometry$)",
      R"(^geo$)",
      R"(^geo[_\s.-]?point$)",
      R"(^lat[_\s.-]?lng$)",
      R"(^lng[_\s.-]?lat$)",
      R"(^lnglat$)",
      R"(^koordinaten$)",
  });
  return patterns;
}

int findPatternIndex(const std::vector<std::regex> &patterns,
                     const std::string &name) {
  for (size_t i = 0; i < patterns.size(); ++i) {
    if (std::regex_match(name, patterns[i])) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool matchesAny(const std::vector<std::regex> &patterns,
                const std::string &name) {
  return findPatternIndex(patterns, name) >= 0;
}

} // namespace GeoPatterns
