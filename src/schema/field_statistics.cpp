#include "schema/field_statistics.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <cmath>
#include <regex>
#include <stdexcept>

namespace {

const std::regex &isoDatePattern() {
  static const std::regex pattern(
      R"(^(\d{4})-(\d{2})-(\d{2})(T\d{2}:\d{2}:\d{2})?$)");
  return pattern;
}

const std::regex &slashDatePattern() {
  static const std::regex pattern(R"(^\d{1,2}/\d{1,2}/\d{2,4}$)");
  return pattern;
}

const std::regex &urlPattern() {
  static const std::regex pattern(R"(^https?://\S+)");
  return pattern;
}

const std::regex &dateTimePattern() {
  static const std::regex pattern(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})");
  return pattern;
}

const std::regex &plainDatePattern() {
  static const std::regex pattern(R"(^\d{4}-\d{2}-\d{2}$)");
  return pattern;
}

const std::regex &numericPattern() {
  static const std::regex pattern(R"(^-?\d+(\.\d+)?$)");
  return pattern;
}

bool isDateString(const std::string &value) {
  std::smatch m;
  if (std::regex_match(value, m, isoDatePattern())) {
    return TimeUtils::isValidCalendarDate(std::stoi(m[1].str()),
                                          std::stoi(m[2].str()),
                                          std::stoi(m[3].str()));
  }
  return std::regex_match(value, slashDatePattern());
}

bool isEmail(const std::string &value) {
  if (value.find(' ') != std::string::npos) {
    return false;
  }
  const size_t at = value.find('@');
  if (at == std::string::npos || at == 0 || at == value.size() - 1) {
    return false;
  }
  if (value.find('@', at + 1) != std::string::npos) {
    return false;
  }
  return value.find('.', at + 1) != std::string::npos;
}

void countFormat(std::map<std::string, size_t> &formats, const char *tag) {
  ++formats[tag];
}

void detectStringFormats(const std::string &value,
                         std::map<std::string, size_t> &formats) {
  if (isEmail(value)) {
    countFormat(formats, "email");
  }
  if (std::regex_search(value, urlPattern())) {
    countFormat(formats, "url");
  }
  if (std::regex_search(value, dateTimePattern())) {
    countFormat(formats, "dateTime");
  }
  if (std::regex_match(value, plainDatePattern())) {
    countFormat(formats, "date");
  }
  if (std::regex_match(value, numericPattern())) {
    countFormat(formats, "numeric");
  }
}

std::optional<double> numericValue(const FieldValue &value) {
  if (value.kind() == FieldValue::Kind::INTEGER) {
    return static_cast<double>(value.asInteger());
  }
  if (value.kind() == FieldValue::Kind::FLOAT && !std::isnan(value.asDouble())) {
    return value.asDouble();
  }
  return std::nullopt;
}

bool isIntegral(double v) { return std::isfinite(v) && std::floor(v) == v; }

void updateNumericStats(FieldStatistics &stats, double v) {
  if (!stats.numericStats) {
    stats.numericStats = NumericStats{v, v, v, isIntegral(v), 1};
    return;
  }
  NumericStats &n = *stats.numericStats;
  n.count++;
  n.min = std::min(n.min, v);
  n.max = std::max(n.max, v);
  n.avg = (n.avg * static_cast<double>(n.count - 1) + v) /
          static_cast<double>(n.count);
  n.isInteger = n.isInteger && isIntegral(v);
}

bool containsValue(const std::vector<FieldValue> &values,
                   const FieldValue &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void refreshEnumPercents(std::vector<EnumValueCount> &values,
                         size_t occurrences) {
  for (auto &entry : values) {
    entry.percent = occurrences == 0
                        ? 0.0
                        : static_cast<double>(entry.count) /
                              static_cast<double>(occurrences) * 100.0;
  }
}

void trackEnumValue(FieldStatistics &stats, const FieldValue &value,
                    size_t maxUniqueValues) {
  if (stats.enumOverflow) {
    return;
  }
  if (!stats.enumValues) {
    stats.enumValues.emplace();
  }
  auto &values = *stats.enumValues;
  auto it = std::find_if(values.begin(), values.end(),
                         [&](const EnumValueCount &e) { return e.value == value; });
  if (it != values.end()) {
    it->count++;
    return;
  }
  if (values.size() >= maxUniqueValues) {
    stats.enumValues.reset();
    stats.enumOverflow = true;
    return;
  }
  values.push_back(EnumValueCount{value, 1, 0.0});
}

template <typename T>
T requireField(const ordered_json &data, const char *key,
               const std::string &context) {
  if (!data.contains(key)) {
    throw std::runtime_error("Missing '" + std::string(key) + "' in " + context);
  }
  try {
    return data.at(key).get<T>();
  } catch (const ordered_json::exception &e) {
    throw std::runtime_error("Invalid '" + std::string(key) + "' in " +
                             context + ": " + e.what());
  }
}

std::map<std::string, size_t> countsFromJson(const ordered_json &data,
                                              const char *key,
                                              const std::string &context) {
  std::map<std::string, size_t> counts;
  if (!data.contains(key)) {
    return counts;
  }
  const auto &node = data.at(key);
  if (!node.is_object()) {
    throw std::runtime_error("'" + std::string(key) + "' in " + context +
                             " must be an object");
  }
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (!it.value().is_number_unsigned()) {
      throw std::runtime_error("Count for '" + it.key() + "' in " + context +
                               " must be a non-negative integer");
    }
    counts[it.key()] = it.value().get<size_t>();
  }
  return counts;
}

} // namespace

FieldStatistics::FieldStatistics(std::string fieldPath)
    : path(std::move(fieldPath)) {
  depth = static_cast<size_t>(std::count(path.begin(), path.end(), '.'));
  firstSeen = TimeUtils::getCurrentTimestamp();
  lastSeen = firstSeen;
}

size_t FieldStatistics::typeCount(const std::string &tag) const {
  auto it = typeDistribution.find(tag);
  return it == typeDistribution.end() ? 0 : it->second;
}

std::string getValueType(const FieldValue &value) {
  switch (value.kind()) {
  case FieldValue::Kind::NULL_VALUE:
    return "null";
  case FieldValue::Kind::BOOL:
    return "boolean";
  case FieldValue::Kind::INTEGER:
    return "integer";
  case FieldValue::Kind::FLOAT:
    return isIntegral(value.asDouble()) ? "integer" : "number";
  case FieldValue::Kind::DATE:
    return "date";
  case FieldValue::Kind::ARRAY:
    return "array";
  case FieldValue::Kind::OBJECT:
    return "object";
  case FieldValue::Kind::STRING: {
    const std::string &text = value.asString();
    if (isDateString(text)) {
      return "date";
    }
    if (StringUtils::equalsIgnoreCase(text, "true") ||
        StringUtils::equalsIgnoreCase(text, "false")) {
      return "boolean-string";
    }
    return "string";
  }
  }
  return "string";
}

void updateFieldStats(FieldStatistics &stats, const FieldValue &value,
                      size_t maxUniqueValues) {
  stats.occurrences++;
  stats.lastSeen = TimeUtils::getCurrentTimestamp();
  if (stats.firstSeen.empty()) {
    stats.firstSeen = stats.lastSeen;
  }

  if (value.isNull()) {
    stats.nullCount++;
  }

  ++stats.typeDistribution[getValueType(value)];

  if (auto numeric = numericValue(value)) {
    updateNumericStats(stats, *numeric);
  }

  if (value.isScalar() && !value.isNull()) {
    if (!containsValue(stats.uniqueSamples, value)) {
      if (stats.uniqueSamples.size() < maxUniqueValues) {
        stats.uniqueSamples.push_back(value);
      } else {
        stats.capped = true;
      }
    }
    trackEnumValue(stats, value, maxUniqueValues);
  }

  if (value.isString()) {
    detectStringFormats(value.asString(), stats.formats);
  }

  stats.uniqueValues = stats.uniqueSamples.size();
  if (stats.enumValues) {
    refreshEnumPercents(*stats.enumValues, stats.occurrences);
  }
}

// Counts, histograms and bounds combine exactly, so merging is order
// independent for them. uniqueSamples keeps a's order first; past the cap
// the union is truncated but uniqueValues reports its full size.
FieldStatistics mergeFieldStats(const FieldStatistics &a,
                                const FieldStatistics &b,
                                size_t maxUniqueValues) {
  if (a.path != b.path) {
    throw std::invalid_argument("Cannot merge statistics for '" + a.path +
                                "' with statistics for '" + b.path + "'");
  }

  FieldStatistics merged;
  merged.path = a.path;
  merged.depth = a.depth;
  merged.occurrences = a.occurrences + b.occurrences;
  merged.nullCount = a.nullCount + b.nullCount;
  merged.typeDistribution = a.typeDistribution;
  for (const auto &[tag, count] : b.typeDistribution) {
    merged.typeDistribution[tag] += count;
  }
  merged.formats = a.formats;
  for (const auto &[tag, count] : b.formats) {
    merged.formats[tag] += count;
  }
  merged.isEnumCandidate = a.isEnumCandidate || b.isEnumCandidate;

  if (a.firstSeen.empty() || b.firstSeen.empty()) {
    merged.firstSeen = a.firstSeen.empty() ? b.firstSeen : a.firstSeen;
  } else {
    merged.firstSeen = std::min(a.firstSeen, b.firstSeen);
  }
  merged.lastSeen = std::max(a.lastSeen, b.lastSeen);

  if (a.numericStats && b.numericStats) {
    const NumericStats &x = *a.numericStats;
    const NumericStats &y = *b.numericStats;
    NumericStats n;
    n.min = std::min(x.min, y.min);
    n.max = std::max(x.max, y.max);
    n.count = x.count + y.count;
    n.avg = n.count == 0 ? 0.0
                         : (x.avg * static_cast<double>(x.count) +
                            y.avg * static_cast<double>(y.count)) /
                               static_cast<double>(n.count);
    n.isInteger = x.isInteger && y.isInteger;
    merged.numericStats = n;
  } else {
    merged.numericStats = a.numericStats ? a.numericStats : b.numericStats;
  }

  std::vector<FieldValue> unionSamples = a.uniqueSamples;
  for (const auto &value : b.uniqueSamples) {
    if (!containsValue(unionSamples, value)) {
      unionSamples.push_back(value);
    }
  }
  merged.uniqueValues = unionSamples.size();
  merged.capped = a.capped || b.capped || unionSamples.size() > maxUniqueValues;
  if (unionSamples.size() > maxUniqueValues) {
    unionSamples.resize(maxUniqueValues);
  }
  merged.uniqueSamples = std::move(unionSamples);

  merged.enumOverflow = a.enumOverflow || b.enumOverflow;
  if (!merged.enumOverflow && (a.enumValues || b.enumValues)) {
    std::vector<EnumValueCount> values =
        a.enumValues ? *a.enumValues : std::vector<EnumValueCount>{};
    if (b.enumValues) {
      for (const auto &entry : *b.enumValues) {
        auto it = std::find_if(
            values.begin(), values.end(),
            [&](const EnumValueCount &e) { return e.value == entry.value; });
        if (it != values.end()) {
          it->count += entry.count;
        } else {
          values.push_back(entry);
        }
      }
    }
    if (values.size() > maxUniqueValues) {
      merged.enumOverflow = true;
    } else {
      refreshEnumPercents(values, merged.occurrences);
      merged.enumValues = std::move(values);
    }
  }

  return merged;
}

ordered_json FieldStatistics::toJson() const {
  ordered_json out;
  out["path"] = path;
  out["occurrences"] = occurrences;
  out["nullCount"] = nullCount;
  out["typeDistribution"] = ordered_json::object();
  for (const auto &[tag, count] : typeDistribution) {
    out["typeDistribution"][tag] = count;
  }
  if (numericStats) {
    out["numericStats"] = {{"min", numericStats->min},
                           {"max", numericStats->max},
                           {"avg", numericStats->avg},
                           {"isInteger", numericStats->isInteger},
                           {"count", numericStats->count}};
  }
  out["uniqueSamples"] = ordered_json::array();
  for (const auto &sample : uniqueSamples) {
    out["uniqueSamples"].push_back(sample.toJson());
  }
  out["uniqueValues"] = uniqueValues;
  out["capped"] = capped;
  out["formats"] = ordered_json::object();
  for (const auto &[tag, count] : formats) {
    out["formats"][tag] = count;
  }
  out["isEnumCandidate"] = isEnumCandidate;
  if (enumValues) {
    out["enumValues"] = ordered_json::array();
    for (const auto &entry : *enumValues) {
      out["enumValues"].push_back({{"value", entry.value.toJson()},
                                   {"count", entry.count},
                                   {"percent", entry.percent}});
    }
  }
  out["enumOverflow"] = enumOverflow;
  out["firstSeen"] = firstSeen;
  out["lastSeen"] = lastSeen;
  out["depth"] = depth;
  return out;
}

static FieldStatistics parseStatistics(const ordered_json &data) {
  if (!data.is_object()) {
    throw std::runtime_error("Field statistics must be a JSON object");
  }
  FieldStatistics stats;
  stats.path = requireField<std::string>(data, "path", "field statistics");
  const std::string context = "statistics for '" + stats.path + "'";

  stats.occurrences = requireField<size_t>(data, "occurrences", context);
  stats.nullCount = data.value("nullCount", static_cast<size_t>(0));
  if (stats.nullCount > stats.occurrences) {
    throw std::runtime_error("nullCount exceeds occurrences in " + context);
  }
  stats.typeDistribution = countsFromJson(data, "typeDistribution", context);
  stats.formats = countsFromJson(data, "formats", context);

  if (data.contains("numericStats") && !data["numericStats"].is_null()) {
    const auto &n = data["numericStats"];
    NumericStats numeric;
    numeric.min = requireField<double>(n, "min", context);
    numeric.max = requireField<double>(n, "max", context);
    numeric.avg = requireField<double>(n, "avg", context);
    numeric.isInteger = n.value("isInteger", false);
    numeric.count = n.value("count", stats.occurrences - stats.nullCount);
    stats.numericStats = numeric;
  }

  if (data.contains("uniqueSamples")) {
    for (const auto &sample : data["uniqueSamples"]) {
      stats.uniqueSamples.push_back(FieldValue::fromJson(sample));
    }
  }
  stats.uniqueValues = data.value("uniqueValues", stats.uniqueSamples.size());
  stats.capped = data.value("capped", false);
  stats.isEnumCandidate = data.value("isEnumCandidate", false);
  stats.enumOverflow = data.value("enumOverflow", false);

  if (data.contains("enumValues") && data["enumValues"].is_array()) {
    std::vector<EnumValueCount> values;
    for (const auto &entry : data["enumValues"]) {
      if (!entry.is_object() || !entry.contains("value")) {
        throw std::runtime_error("Malformed enum value in " + context);
      }
      values.push_back(EnumValueCount{FieldValue::fromJson(entry["value"]),
                                      entry.value("count", static_cast<size_t>(0)),
                                      entry.value("percent", 0.0)});
    }
    stats.enumValues = std::move(values);
  }

  stats.firstSeen = data.value("firstSeen", std::string());
  stats.lastSeen = data.value("lastSeen", std::string());
  stats.depth = data.value(
      "depth",
      static_cast<size_t>(std::count(stats.path.begin(), stats.path.end(), '.')));
  return stats;
}

FieldStatistics FieldStatistics::fromJson(const ordered_json &data) {
  try {
    return parseStatistics(data);
  } catch (const ordered_json::exception &e) {
    throw std::runtime_error("Malformed field statistics: " +
                             std::string(e.what()));
  }
}

FieldStatistics &FieldStatsMap::getOrCreate(const std::string &path) {
  auto it = index_.find(path);
  if (it != index_.end()) {
    return fields_[it->second];
  }
  index_.emplace(path, fields_.size());
  fields_.emplace_back(path);
  return fields_.back();
}

const FieldStatistics *FieldStatsMap::find(const std::string &path) const {
  auto it = index_.find(path);
  return it == index_.end() ? nullptr : &fields_[it->second];
}

FieldStatistics *FieldStatsMap::find(const std::string &path) {
  auto it = index_.find(path);
  return it == index_.end() ? nullptr : &fields_[it->second];
}

bool FieldStatsMap::contains(const std::string &path) const {
  return index_.count(path) > 0;
}

void FieldStatsMap::put(FieldStatistics stats) {
  auto it = index_.find(stats.path);
  if (it != index_.end()) {
    fields_[it->second] = std::move(stats);
    return;
  }
  index_.emplace(stats.path, fields_.size());
  fields_.push_back(std::move(stats));
}

ordered_json FieldStatsMap::toJson() const {
  ordered_json out = ordered_json::object();
  for (const auto &stats : fields_) {
    out[stats.path] = stats.toJson();
  }
  return out;
}

FieldStatsMap FieldStatsMap::fromJson(const ordered_json &data) {
  if (!data.is_object()) {
    throw std::runtime_error("Field statistics map must be a JSON object");
  }
  FieldStatsMap map;
  for (auto it = data.begin(); it != data.end(); ++it) {
    ordered_json entry = it.value();
    if (entry.is_object() && !entry.contains("path")) {
      entry["path"] = it.key();
    }
    FieldStatistics stats = FieldStatistics::fromJson(entry);
    if (stats.path != it.key()) {
      throw std::runtime_error("Statistics keyed '" + it.key() +
                               "' carry path '" + stats.path + "'");
    }
    map.put(std::move(stats));
  }
  return map;
}

FieldStatsMap mergeFieldStatsMaps(const FieldStatsMap &a, const FieldStatsMap &b,
                                  size_t maxUniqueValues) {
  FieldStatsMap merged;
  for (const auto &stats : a) {
    const FieldStatistics *other = b.find(stats.path);
    merged.put(other ? mergeFieldStats(stats, *other, maxUniqueValues) : stats);
  }
  for (const auto &stats : b) {
    if (!a.contains(stats.path)) {
      merged.put(stats);
    }
  }
  return merged;
}
