#include "schema/schema_builder.h"
#include "core/logger.h"
#include "geo/coordinate_field_scorer.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <iterator>
#include <regex>
#include <stdexcept>

namespace {

constexpr double REQUIRED_RATIO = 0.9;
constexpr double ID_OCCURRENCE_RATIO = 0.9;
constexpr size_t MAX_CONFLICT_SAMPLES = 5;

const std::regex &idNamePattern() {
  static const std::regex pattern(R"(^(id|uuid|guid|_id|identifier|key)$)",
                                  std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

bool isIgnoredTag(const std::string &tag) {
  return tag == "null" || tag == "undefined";
}

std::string mapToSchemaType(const std::string &tag) {
  if (tag == "date" || tag == "boolean-string") {
    return "string";
  }
  if (tag == "integer" || tag == "number" || tag == "boolean" ||
      tag == "object" || tag == "array" || tag == "string") {
    return tag;
  }
  return "string";
}

std::string dominantTag(const FieldStatistics &stats) {
  std::string best;
  size_t bestCount = 0;
  for (const auto &[tag, count] : stats.typeDistribution) {
    if (!isIgnoredTag(tag) && count > bestCount) {
      best = tag;
      bestCount = count;
    }
  }
  return best;
}

SchemaField buildField(const FieldStatistics &stats, size_t recordCount) {
  SchemaField field;
  field.name = stats.path;

  std::vector<std::pair<std::string, size_t>> tags;
  for (const auto &[tag, count] : stats.typeDistribution) {
    if (!isIgnoredTag(tag) && count > 0) {
      tags.emplace_back(tag, count);
    }
  }
  std::stable_sort(tags.begin(), tags.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });

  for (const auto &[tag, count] : tags) {
    std::string type = mapToSchemaType(tag);
    if (std::find(field.types.begin(), field.types.end(), type) == field.types.end()) {
      field.types.push_back(type);
    }
  }
  if (stats.nullCount > 0) {
    field.types.push_back("null");
  }

  field.required =
      stats.depth == 0 &&
      static_cast<double>(stats.occurrences) >=
          REQUIRED_RATIO * static_cast<double>(recordCount);

  if (stats.isEnumCandidate && stats.enumValues) {
    std::vector<FieldValue> values;
    for (const auto &entry : *stats.enumValues) {
      values.push_back(entry.value);
    }
    field.enumValues = std::move(values);
  }
  if (stats.numericStats) {
    field.minimum = stats.numericStats->min;
    field.maximum = stats.numericStats->max;
  }
  return field;
}

ordered_json geoFieldsToJson(const DetectedGeoFields &geo) {
  ordered_json out;
  if (geo.latitude) {
    out["latitude"] = *geo.latitude;
  }
  if (geo.longitude) {
    out["longitude"] = *geo.longitude;
  }
  out["confidence"] = geo.confidence;
  return out;
}

DetectedGeoFields geoFieldsFromJson(const ordered_json &data) {
  DetectedGeoFields geo;
  if (!data.is_object()) {
    return geo;
  }
  if (data.contains("latitude") && data["latitude"].is_string()) {
    geo.latitude = data["latitude"].get<std::string>();
  }
  if (data.contains("longitude") && data["longitude"].is_string()) {
    geo.longitude = data["longitude"].get<std::string>();
  }
  geo.confidence = data.value("confidence", 0.0);
  return geo;
}

SchemaBuilderState parseState(const ordered_json &data) {
  if (!data.is_object()) {
    throw std::runtime_error("Schema builder state must be a JSON object");
  }
  SchemaBuilderState state;
  state.version = data.value("version", static_cast<size_t>(0));
  state.recordCount = data.value("recordCount", static_cast<size_t>(0));
  state.batchCount = data.value("batchCount", static_cast<size_t>(0));
  state.lastUpdated = data.value("lastUpdated", std::string());

  if (data.contains("fieldStats")) {
    state.fieldStats = FieldStatsMap::fromJson(data["fieldStats"]);
  }

  if (data.contains("dataSamples")) {
    for (const auto &row : rowsFromJson(data["dataSamples"])) {
      state.dataSamples.push_back(row);
    }
  }

  if (data.contains("detectedIdFields")) {
    state.detectedIdFields =
        data["detectedIdFields"].get<std::vector<std::string>>();
  }
  if (data.contains("detectedGeoFields")) {
    state.detectedGeoFields = geoFieldsFromJson(data["detectedGeoFields"]);
  }

  if (data.contains("typeConflicts")) {
    for (const auto &entry : data["typeConflicts"]) {
      TypeConflict conflict;
      conflict.path = entry.at("path").get<std::string>();
      if (entry.contains("types")) {
        for (auto it = entry["types"].begin(); it != entry["types"].end(); ++it) {
          conflict.types[it.key()] = it.value().get<size_t>();
        }
      }
      if (entry.contains("samples")) {
        for (const auto &sample : entry["samples"]) {
          conflict.samples.emplace_back(sample.at("type").get<std::string>(),
                                        FieldValue::fromJson(sample.at("value")));
        }
      }
      state.typeConflicts.push_back(std::move(conflict));
    }
  }
  return state;
}

} // namespace

void SchemaBuilderConfig::validate() const {
  if (maxSamples == 0) {
    throw std::invalid_argument("maxSamples must be at least 1");
  }
  if (maxUniqueValues == 0) {
    throw std::invalid_argument("maxUniqueValues must be at least 1");
  }
  if (enumThreshold == 0) {
    throw std::invalid_argument("enumThreshold must be at least 1");
  }
  if (maxDepth == 0) {
    throw std::invalid_argument("maxDepth must be at least 1");
  }
}

ordered_json SchemaBuilderState::toJson() const {
  ordered_json out;
  out["version"] = version;
  out["recordCount"] = recordCount;
  out["batchCount"] = batchCount;
  out["fieldStats"] = fieldStats.toJson();
  out["dataSamples"] = ordered_json::array();
  for (const auto &row : dataSamples) {
    out["dataSamples"].push_back(rowToJson(row));
  }
  out["detectedIdFields"] = detectedIdFields;
  out["detectedGeoFields"] = geoFieldsToJson(detectedGeoFields);
  out["typeConflicts"] = ordered_json::array();
  for (const auto &conflict : typeConflicts) {
    ordered_json entry;
    entry["path"] = conflict.path;
    entry["types"] = ordered_json::object();
    for (const auto &[tag, count] : conflict.types) {
      entry["types"][tag] = count;
    }
    entry["samples"] = ordered_json::array();
    for (const auto &[tag, value] : conflict.samples) {
      entry["samples"].push_back({{"type", tag}, {"value", value.toJson()}});
    }
    out["typeConflicts"].push_back(std::move(entry));
  }
  out["lastUpdated"] = lastUpdated;
  return out;
}

SchemaBuilderState SchemaBuilderState::fromJson(const ordered_json &data) {
  try {
    return parseState(data);
  } catch (const ordered_json::exception &e) {
    throw std::runtime_error("Malformed schema builder state: " +
                             std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    throw std::runtime_error("Malformed schema builder state: " +
                             std::string(e.what()));
  }
}

ordered_json SchemaSummary::toJson() const {
  ordered_json out;
  out["recordCount"] = recordCount;
  out["fieldCount"] = fieldCount;
  out["version"] = version;
  out["detectedPatterns"] = {{"idFields", idFields},
                             {"geoFields", geoFieldsToJson(geoFields)},
                             {"enumFields", enumFields}};
  return out;
}

ProgressiveSchemaBuilder::ProgressiveSchemaBuilder(SchemaBuilderConfig config)
    : config_(config) {
  config_.validate();
}

ProgressiveSchemaBuilder::ProgressiveSchemaBuilder(SchemaBuilderState state,
                                                   SchemaBuilderConfig config)
    : config_(config), state_(std::move(state)) {
  config_.validate();
  while (state_.dataSamples.size() > config_.maxSamples) {
    state_.dataSamples.pop_front();
  }
}

ProgressiveSchemaBuilder
ProgressiveSchemaBuilder::fromState(const ordered_json &data,
                                    SchemaBuilderConfig config) {
  return ProgressiveSchemaBuilder(SchemaBuilderState::fromJson(data), config);
}

BatchResult ProgressiveSchemaBuilder::processBatch(const std::vector<Row> &rows) {
  BatchResult result;

  appendSamples(rows);
  for (const auto &row : rows) {
    processRecord(row, "", 0, result.changes);
  }

  state_.recordCount += rows.size();
  state_.batchCount++;
  state_.lastUpdated = TimeUtils::getCurrentTimestamp();

  runDetection();

  result.schemaChanged = std::any_of(
      result.changes.begin(), result.changes.end(), [](const SchemaChange &c) {
        return c.type == ChangeType::NEW_FIELD || c.type == ChangeType::TYPE_CHANGE;
      });
  if (result.schemaChanged) {
    state_.version++;
  }

  Logger::debug(LogCategory::SCHEMA, "ProgressiveSchemaBuilder::processBatch",
                "Batch " + std::to_string(state_.batchCount) + ": " +
                    std::to_string(rows.size()) + " rows, " +
                    std::to_string(result.changes.size()) + " changes, " +
                    std::to_string(state_.fieldStats.size()) + " fields");
  return result;
}

void ProgressiveSchemaBuilder::processRecord(const Row &record,
                                             const std::string &prefix,
                                             size_t depth,
                                             std::vector<SchemaChange> &changes) {
  if (depth >= config_.maxDepth) {
    return;
  }

  for (const auto &[key, value] : record) {
    const std::string path = prefix.empty() ? key : prefix + "." + key;
    const std::string newType = getValueType(value);

    if (!state_.fieldStats.contains(path)) {
      SchemaChange change;
      change.type = ChangeType::NEW_FIELD;
      change.path = path;
      change.description = "Field '" + path + "' was added";
      change.severity = ChangeSeverity::INFO;
      change.autoApprovable = true;
      change.newType = newType;
      changes.push_back(std::move(change));
    }

    FieldStatistics &stats = state_.fieldStats.getOrCreate(path);

    if (stats.occurrences > 0 && newType != "null" && stats.typeCount(newType) == 0) {
      const std::string oldType = dominantTag(stats);
      if (!oldType.empty()) {
        recordTypeConflict(path, stats, newType, value);

        SchemaChange change;
        change.type = ChangeType::TYPE_CHANGE;
        change.path = path;
        change.description = "Field '" + path + "' type changed from " +
                             oldType + " to " + newType;
        change.severity = ChangeSeverity::WARNING;
        change.autoApprovable = false;
        change.oldType = oldType;
        change.newType = newType;
        changes.push_back(std::move(change));
      }
    }

    updateFieldStats(stats, value, config_.maxUniqueValues);

    // stats may dangle once nested paths are added below
    processNestedValue(value, path, depth, changes);
  }
}

void ProgressiveSchemaBuilder::processNestedValue(const FieldValue &value,
                                                  const std::string &path,
                                                  size_t depth,
                                                  std::vector<SchemaChange> &changes) {
  if (value.kind() == FieldValue::Kind::OBJECT) {
    processRecord(rowFromJson(value.asJson()), path, depth + 1, changes);
    return;
  }
  if (value.kind() == FieldValue::Kind::ARRAY) {
    const ordered_json &items = value.asJson();
    if (!items.empty() && items.front().is_object()) {
      processRecord(rowFromJson(items.front()), path + "[]", depth + 1, changes);
    }
  }
}

void ProgressiveSchemaBuilder::recordTypeConflict(const std::string &path,
                                                  const FieldStatistics &stats,
                                                  const std::string &newType,
                                                  const FieldValue &value) {
  auto it = std::find_if(state_.typeConflicts.begin(), state_.typeConflicts.end(),
                         [&](const TypeConflict &c) { return c.path == path; });
  if (it == state_.typeConflicts.end()) {
    TypeConflict conflict;
    conflict.path = path;
    for (const auto &[tag, count] : stats.typeDistribution) {
      if (!isIgnoredTag(tag) && count > 0) {
        conflict.types[tag] = count;
      }
    }
    state_.typeConflicts.push_back(std::move(conflict));
    it = std::prev(state_.typeConflicts.end());
  }
  ++it->types[newType];
  if (it->samples.size() < MAX_CONFLICT_SAMPLES) {
    it->samples.emplace_back(newType, value);
  }

  Logger::warning(LogCategory::SCHEMA, "ProgressiveSchemaBuilder::recordTypeConflict",
                  "Field '" + path + "' now also holds " + newType + " values");
}

void ProgressiveSchemaBuilder::appendSamples(const std::vector<Row> &rows) {
  for (const auto &row : rows) {
    state_.dataSamples.push_back(row);
    if (state_.dataSamples.size() > config_.maxSamples) {
      state_.dataSamples.pop_front();
    }
  }
}

void ProgressiveSchemaBuilder::mergeState(const SchemaBuilderState &other) {
  const size_t fieldsBefore = state_.fieldStats.size();

  state_.fieldStats = mergeFieldStatsMaps(state_.fieldStats, other.fieldStats,
                                          config_.maxUniqueValues);
  state_.recordCount += other.recordCount;
  state_.batchCount += other.batchCount;

  for (const auto &row : other.dataSamples) {
    state_.dataSamples.push_back(row);
    if (state_.dataSamples.size() > config_.maxSamples) {
      state_.dataSamples.pop_front();
    }
  }

  for (const auto &conflict : other.typeConflicts) {
    auto it = std::find_if(state_.typeConflicts.begin(), state_.typeConflicts.end(),
                           [&](const TypeConflict &c) { return c.path == conflict.path; });
    if (it == state_.typeConflicts.end()) {
      state_.typeConflicts.push_back(conflict);
      continue;
    }
    for (const auto &[tag, count] : conflict.types) {
      it->types[tag] += count;
    }
    for (const auto &sample : conflict.samples) {
      if (it->samples.size() >= MAX_CONFLICT_SAMPLES) {
        break;
      }
      it->samples.push_back(sample);
    }
  }

  state_.lastUpdated = TimeUtils::getCurrentTimestamp();
  runDetection();

  if (state_.fieldStats.size() != fieldsBefore) {
    state_.version++;
  }
  Logger::info(LogCategory::SCHEMA, "ProgressiveSchemaBuilder::mergeState",
               "Merged statistics for " + std::to_string(other.fieldStats.size()) +
                   " fields; " + std::to_string(state_.recordCount) +
                   " records total");
}

void ProgressiveSchemaBuilder::runDetection() {
  detectIdFields();
  detectGeoFields();
  detectEnums();
}

// A column is an ID when its name says so and every non-null value seen
// so far was distinct. Capped statistics cannot prove distinctness.
void ProgressiveSchemaBuilder::detectIdFields() {
  state_.detectedIdFields.clear();
  const double minOccurrences =
      ID_OCCURRENCE_RATIO * static_cast<double>(state_.recordCount);

  for (const auto &stats : state_.fieldStats) {
    const std::string name = StringUtils::terminalSegment(stats.path);
    const bool idName = std::regex_match(name, idNamePattern()) ||
                        StringUtils::endsWith(StringUtils::toLower(name), "_id");
    if (!idName || stats.capped) {
      continue;
    }
    if (static_cast<double>(stats.occurrences) <= minOccurrences) {
      continue;
    }
    if (stats.uniqueValues > 0 && stats.uniqueValues == stats.nonNullCount()) {
      state_.detectedIdFields.push_back(stats.path);
    }
  }
}

void ProgressiveSchemaBuilder::detectGeoFields() {
  CoordinateFieldScorer scorer;
  auto latitude = scorer.findCoordinateField(state_.fieldStats, CoordinateAxis::LATITUDE);
  auto longitude = scorer.findCoordinateField(state_.fieldStats, CoordinateAxis::LONGITUDE);

  DetectedGeoFields geo;
  if (latitude) {
    geo.latitude = latitude->path;
  }
  if (longitude) {
    geo.longitude = longitude->path;
  }
  if (latitude && longitude) {
    geo.confidence = (latitude->confidence + longitude->confidence) / 2.0;
  }
  state_.detectedGeoFields = geo;
}

void ProgressiveSchemaBuilder::detectEnums() {
  for (const auto &stats : state_.fieldStats) {
    FieldStatistics *mutableStats = state_.fieldStats.find(stats.path);
    bool candidate = false;

    if (stats.occurrences > 0 && stats.uniqueValues > 0 && !stats.capped &&
        !stats.enumOverflow && stats.nonNullCount() > stats.uniqueValues) {
      if (config_.enumMode == EnumMode::COUNT) {
        candidate = stats.uniqueValues <= config_.enumThreshold;
      } else {
        candidate = static_cast<double>(stats.uniqueValues) /
                        static_cast<double>(stats.occurrences) <=
                    static_cast<double>(config_.enumThreshold) / 100.0;
      }
    }
    mutableStats->isEnumCandidate = candidate;
  }
}

std::vector<Row> ProgressiveSchemaBuilder::sampleRows() const {
  return std::vector<Row>(state_.dataSamples.begin(), state_.dataSamples.end());
}

StructuralSchema ProgressiveSchemaBuilder::getSchema() const {
  StructuralSchema schema;
  for (const auto &stats : state_.fieldStats) {
    schema.addField(buildField(stats, state_.recordCount));
  }
  return schema;
}

SchemaComparison
ProgressiveSchemaBuilder::compareWithPrevious(const StructuralSchema &previous) const {
  return compareSchemas(previous, getSchema());
}

SchemaSummary ProgressiveSchemaBuilder::getSummary() const {
  SchemaSummary summary;
  summary.recordCount = state_.recordCount;
  summary.fieldCount = state_.fieldStats.size();
  summary.version = state_.version;
  summary.idFields = state_.detectedIdFields;
  summary.geoFields = state_.detectedGeoFields;
  for (const auto &stats : state_.fieldStats) {
    if (stats.isEnumCandidate) {
      summary.enumFields.push_back(stats.path);
    }
  }
  return summary;
}
