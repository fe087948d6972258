#include "schema/schema_similarity.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/text_similarity.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <regex>
#include <set>
#include <stdexcept>

namespace {

struct SynonymGroup {
  const char *base;
  std::vector<std::string> members;
};

const std::vector<SynonymGroup> &synonymGroups() {
  static const std::vector<SynonymGroup> groups = {
      {"title", {"name", "event", "label", "heading", "subject"}},
      {"description", {"desc", "details", "summary", "notes", "content", "text"}},
      {"date", {"timestamp", "datetime", "time", "when", "start", "created"}},
      {"location", {"address", "place", "venue", "city", "area", "region"}},
      {"latitude", {"lat", "y", "coord_y"}},
      {"longitude", {"lng", "lon", "long", "x", "coord_x"}},
  };
  return groups;
}

bool inGroup(const SynonymGroup &group, const std::string &name) {
  return name == group.base ||
         std::find(group.members.begin(), group.members.end(), name) != group.members.end();
}

constexpr std::array<const char *, 6> GEO_HINTS = {"lat",     "lon",   "lng",
                                                   "location", "address", "coord"};
constexpr std::array<const char *, 6> DATE_HINTS = {"date", "time",    "timestamp",
                                                    "when", "created", "start"};

template <size_t N>
bool anyHeaderContains(const std::vector<std::string> &headers,
                       const std::array<const char *, N> &hints) {
  for (const auto &header : headers) {
    const std::string lower = StringUtils::toLower(header);
    for (const char *hint : hints) {
      if (lower.find(hint) != std::string::npos) {
        return true;
      }
    }
  }
  return false;
}

double agreement(bool uploaded, bool dataset) {
  if (uploaded && dataset) {
    return 100.0;
  }
  if (uploaded || dataset) {
    return 0.0;
  }
  return 50.0;
}

const std::regex &similarityDatePattern() {
  static const std::regex pattern(R"(^\d{4}-\d{2}-\d{2}|^\d{2}[/.]\d{2}[/.]\d{4})");
  return pattern;
}

bool isNumericString(const std::string &value) {
  const std::string trimmed = StringUtils::trim(value);
  if (trimmed.empty()) {
    return false;
  }
  try {
    size_t consumed = 0;
    double parsed = std::stod(trimmed, &consumed);
    return consumed == trimmed.size() && std::isfinite(parsed);
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

struct OverlapResult {
  double score = 0.0;
  std::vector<std::string> matching;
  std::vector<std::string> missing;
  std::vector<std::string> added;
};

// For each target field, its best uploaded counterpart. Unclaimed uploaded
// headers are reported as new.
OverlapResult calculateFieldOverlap(const std::vector<std::string> &uploaded,
                                    const std::vector<std::string> &target) {
  OverlapResult result;
  std::set<std::string> claimed;

  for (const auto &field : target) {
    auto match = SchemaSimilarity::findBestMatch(field, uploaded);
    if (match) {
      result.matching.push_back(field);
      claimed.insert(match->field);
    } else {
      result.missing.push_back(field);
    }
  }
  for (const auto &header : uploaded) {
    if (claimed.count(header) == 0) {
      result.added.push_back(header);
    }
  }

  std::set<std::string> uploadedNames;
  std::set<std::string> targetNames;
  for (const auto &header : uploaded) {
    uploadedNames.insert(StringUtils::toLower(header));
  }
  for (const auto &field : target) {
    targetNames.insert(StringUtils::toLower(field));
  }

  const double jaccard = TextSimilarity::jaccardIndex(uploadedNames, targetNames);
  const double larger =
      static_cast<double>(std::max({uploaded.size(), target.size(), static_cast<size_t>(1)}));
  const double matched = static_cast<double>(result.matching.size()) / larger;
  result.score = std::min(100.0, (0.4 * jaccard + 0.6 * matched) * 100.0);
  return result;
}

double calculateTypeCompatibility(const UploadedSchema &uploaded,
                                  const DatasetSchema &dataset) {
  if (dataset.fieldTypes.empty()) {
    return 70.0;
  }

  std::map<std::string, std::string> uploadedTypes;
  for (const auto &header : uploaded.headers) {
    std::vector<FieldValue> values;
    for (const auto &row : uploaded.sampleData) {
      if (const FieldValue *value = findField(row, header)) {
        values.push_back(*value);
      }
    }
    uploadedTypes[header] = SchemaSimilarity::inferFieldType(values);
  }

  size_t compared = 0;
  size_t compatible = 0;
  for (const auto &[field, expected] : dataset.fieldTypes) {
    auto match = SchemaSimilarity::findBestMatch(field, uploaded.headers);
    if (!match) {
      continue;
    }
    ++compared;
    if (SchemaSimilarity::areTypesCompatible(uploadedTypes[match->field], expected)) {
      ++compatible;
    }
  }

  if (compared == 0) {
    return 50.0;
  }
  return static_cast<double>(compatible) / static_cast<double>(compared) * 100.0;
}

double calculateStructureSimilarity(size_t uploadedCount, size_t datasetCount) {
  if (uploadedCount == 0 || datasetCount == 0) {
    return 0.0;
  }
  return static_cast<double>(std::min(uploadedCount, datasetCount)) /
         static_cast<double>(std::max(uploadedCount, datasetCount)) * 100.0;
}

double calculateSemanticHints(const UploadedSchema &uploaded,
                              const DatasetSchema &dataset) {
  const bool uploadedGeo = anyHeaderContains(uploaded.headers, GEO_HINTS);
  const bool uploadedDate = anyHeaderContains(uploaded.headers, DATE_HINTS);
  return (agreement(uploadedGeo, dataset.hasGeoFields) +
          agreement(uploadedDate, dataset.hasDateFields)) /
         2.0;
}

double calculateLanguageMatch(const std::string &datasetLanguage,
                              const std::optional<std::string> &detected) {
  if (!detected || detected->empty()) {
    return 50.0;
  }
  return *detected == datasetLanguage ? 100.0 : 30.0;
}

int roundScore(double value) { return static_cast<int>(std::lround(value)); }

ordered_json namesToJson(const std::vector<std::string> &names) {
  ordered_json out = ordered_json::array();
  for (const auto &name : names) {
    out.push_back(name);
  }
  return out;
}

} // namespace

DatasetSchema DatasetSchema::fromJson(const ordered_json &data) {
  if (!data.is_object()) {
    throw std::runtime_error("Catalog entry must be a JSON object");
  }
  try {
    DatasetSchema schema;
    const auto &id = data.at("datasetId");
    schema.datasetId = id.is_string() ? id.get<std::string>() : id.dump();
    schema.datasetName = data.value("datasetName", schema.datasetId);
    schema.language = data.value("language", std::string("eng"));
    schema.fields = data.value("fields", std::vector<std::string>{});
    if (data.contains("fieldTypes") && data["fieldTypes"].is_object()) {
      for (auto it = data["fieldTypes"].begin(); it != data["fieldTypes"].end(); ++it) {
        schema.fieldTypes[it.key()] = it.value().get<std::string>();
      }
    }
    schema.hasGeoFields = data.value("hasGeoFields", false);
    schema.hasDateFields = data.value("hasDateFields", false);
    return schema;
  } catch (const ordered_json::exception &e) {
    throw std::runtime_error("Malformed catalog entry: " + std::string(e.what()));
  }
}

ordered_json SimilarityResult::toJson() const {
  ordered_json out;
  out["datasetId"] = datasetId;
  out["datasetName"] = datasetName;
  out["score"] = score;
  out["breakdown"] = {{"fieldOverlap", breakdown.fieldOverlap},
                      {"typeCompatibility", breakdown.typeCompatibility},
                      {"structureSimilarity", breakdown.structureSimilarity},
                      {"semanticHints", breakdown.semanticHints},
                      {"languageMatch", breakdown.languageMatch}};
  out["matchingFields"] = namesToJson(matchingFields);
  out["missingFields"] = namesToJson(missingFields);
  out["newFields"] = namesToJson(newFields);
  return out;
}

bool SchemaSimilarity::areSynonyms(const std::string &a, const std::string &b) {
  const std::string x = StringUtils::toLower(a);
  const std::string y = StringUtils::toLower(b);
  for (const auto &group : synonymGroups()) {
    if (inGroup(group, x) && inGroup(group, y)) {
      return true;
    }
  }
  return false;
}

bool SchemaSimilarity::areTypesCompatible(const std::string &a, const std::string &b) {
  if (a == b) {
    return true;
  }
  static const std::vector<std::set<std::string>> groups = {
      {"string", "date", "numeric_string"},
      {"number", "integer", "numeric_string"},
      {"boolean", "string"},
  };
  for (const auto &group : groups) {
    if (group.count(a) > 0 && group.count(b) > 0) {
      return true;
    }
  }
  return false;
}

std::optional<FieldMatch>
SchemaSimilarity::findBestMatch(const std::string &field,
                                const std::vector<std::string> &candidates) {
  std::optional<FieldMatch> best;
  for (const auto &candidate : candidates) {
    if (StringUtils::equalsIgnoreCase(field, candidate)) {
      return FieldMatch{candidate, 1.0};
    }
    if (areSynonyms(field, candidate)) {
      if (!best || SYNONYM_SCORE > best->score) {
        best = FieldMatch{candidate, SYNONYM_SCORE};
      }
      continue;
    }
    const double similarity = TextSimilarity::fieldNameSimilarity(field, candidate);
    if (similarity >= MIN_FUZZY_MATCH && (!best || similarity > best->score)) {
      best = FieldMatch{candidate, similarity};
    }
  }
  return best;
}

std::string SchemaSimilarity::classifyValueType(const FieldValue &value) {
  switch (value.kind()) {
  case FieldValue::Kind::NULL_VALUE:
    return "null";
  case FieldValue::Kind::BOOL:
    return "boolean";
  case FieldValue::Kind::INTEGER:
    return "integer";
  case FieldValue::Kind::FLOAT: {
    const double v = value.asDouble();
    return std::isfinite(v) && std::floor(v) == v ? "integer" : "number";
  }
  case FieldValue::Kind::DATE:
    return "date";
  case FieldValue::Kind::ARRAY:
    return "array";
  case FieldValue::Kind::OBJECT:
    return "object";
  case FieldValue::Kind::STRING:
    if (std::regex_search(value.asString(), similarityDatePattern())) {
      return "date";
    }
    return isNumericString(value.asString()) ? "numeric_string" : "string";
  }
  return "string";
}

std::string SchemaSimilarity::inferFieldType(const std::vector<FieldValue> &values) {
  std::vector<std::pair<std::string, size_t>> counts;
  for (const auto &value : values) {
    const std::string type = classifyValueType(value);
    if (type == "null") {
      continue;
    }
    auto it = std::find_if(counts.begin(), counts.end(),
                           [&](const auto &entry) { return entry.first == type; });
    if (it == counts.end()) {
      counts.emplace_back(type, 1);
    } else {
      ++it->second;
    }
  }

  std::string dominant = "string";
  size_t maxCount = 0;
  for (const auto &[type, count] : counts) {
    if (count > maxCount) {
      dominant = type;
      maxCount = count;
    }
  }
  return dominant;
}

SimilarityResult SchemaSimilarity::calculateSchemaSimilarity(
    const UploadedSchema &uploaded, const DatasetSchema &dataset,
    const std::optional<std::string> &detectedLanguage) const {
  OverlapResult overlap = calculateFieldOverlap(uploaded.headers, dataset.fields);
  const double typeScore = calculateTypeCompatibility(uploaded, dataset);
  const double structure =
      calculateStructureSimilarity(uploaded.headers.size(), dataset.fields.size());
  const double semantic = calculateSemanticHints(uploaded, dataset);
  const double language = calculateLanguageMatch(dataset.language, detectedLanguage);

  SimilarityResult result;
  result.datasetId = dataset.datasetId;
  result.datasetName = dataset.datasetName;
  result.breakdown.fieldOverlap = roundScore(overlap.score);
  result.breakdown.typeCompatibility = roundScore(typeScore);
  result.breakdown.structureSimilarity = roundScore(structure);
  result.breakdown.semanticHints = roundScore(semantic);
  result.breakdown.languageMatch = roundScore(language);
  result.score = roundScore(overlap.score * FIELD_OVERLAP_WEIGHT +
                            typeScore * TYPE_COMPATIBILITY_WEIGHT +
                            structure * STRUCTURE_WEIGHT + semantic * SEMANTIC_WEIGHT +
                            language * LANGUAGE_WEIGHT);
  result.matchingFields = std::move(overlap.matching);
  result.missingFields = std::move(overlap.missing);
  result.newFields = std::move(overlap.added);
  return result;
}

std::vector<SimilarityResult> SchemaSimilarity::findSimilarDatasets(
    const UploadedSchema &uploaded, const std::vector<DatasetSchema> &catalog,
    const std::optional<std::string> &detectedLanguage, size_t minScore,
    size_t maxResults) const {
  std::vector<SimilarityResult> results;
  for (const auto &dataset : catalog) {
    SimilarityResult result = calculateSchemaSimilarity(uploaded, dataset, detectedLanguage);
    if (result.score >= static_cast<int>(minScore)) {
      results.push_back(std::move(result));
    }
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const SimilarityResult &a, const SimilarityResult &b) {
                     return a.score > b.score;
                   });
  if (results.size() > maxResults) {
    results.resize(maxResults);
  }

  Logger::debug(LogCategory::SIMILARITY, "SchemaSimilarity::findSimilarDatasets",
                std::to_string(results.size()) + " of " +
                    std::to_string(catalog.size()) + " datasets above score " +
                    std::to_string(minScore));
  return results;
}
