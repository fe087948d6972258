#ifndef FIELD_STATISTICS_H
#define FIELD_STATISTICS_H

#include "core/engine_config.h"
#include "core/field_value.h"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct NumericStats {
  double min = 0.0;
  double max = 0.0;
  double avg = 0.0;
  bool isInteger = true;
  size_t count = 0;
};

struct EnumValueCount {
  FieldValue value;
  size_t count = 0;
  double percent = 0.0;
};

struct FieldStatistics {
  std::string path;
  size_t occurrences = 0;
  size_t nullCount = 0;
  std::map<std::string, size_t> typeDistribution;
  std::optional<NumericStats> numericStats;
  std::vector<FieldValue> uniqueSamples;
  size_t uniqueValues = 0;
  bool capped = false;
  std::map<std::string, size_t> formats;
  bool isEnumCandidate = false;
  std::optional<std::vector<EnumValueCount>> enumValues;
  bool enumOverflow = false;
  std::string firstSeen;
  std::string lastSeen;
  size_t depth = 0;

  FieldStatistics() = default;
  explicit FieldStatistics(std::string fieldPath);

  size_t nonNullCount() const { return occurrences - nullCount; }

  // Count for one type tag, 0 when never seen.
  size_t typeCount(const std::string &tag) const;

  ordered_json toJson() const;
  static FieldStatistics fromJson(const ordered_json &data);
};

// Type tag used in typeDistribution: null, boolean, integer, number,
// string, boolean-string, date, array or object.
std::string getValueType(const FieldValue &value);

void updateFieldStats(FieldStatistics &stats, const FieldValue &value,
                      size_t maxUniqueValues = EngineConfig::getMaxUniqueValues());

// Combines two partial statistics for the same path. Throws
// std::invalid_argument when the paths differ.
FieldStatistics
mergeFieldStats(const FieldStatistics &a, const FieldStatistics &b,
                size_t maxUniqueValues = EngineConfig::getMaxUniqueValues());

// Per-path statistics in order of first appearance.
class FieldStatsMap {
public:
  using const_iterator = std::vector<FieldStatistics>::const_iterator;

  FieldStatistics &getOrCreate(const std::string &path);
  const FieldStatistics *find(const std::string &path) const;
  FieldStatistics *find(const std::string &path);
  bool contains(const std::string &path) const;

  // Replaces or appends.
  void put(FieldStatistics stats);

  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }
  const_iterator begin() const { return fields_.begin(); }
  const_iterator end() const { return fields_.end(); }

  ordered_json toJson() const;
  static FieldStatsMap fromJson(const ordered_json &data);

private:
  std::vector<FieldStatistics> fields_;
  std::unordered_map<std::string, size_t> index_;
};

FieldStatsMap
mergeFieldStatsMaps(const FieldStatsMap &a, const FieldStatsMap &b,
                    size_t maxUniqueValues = EngineConfig::getMaxUniqueValues());

#endif
