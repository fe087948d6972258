#ifndef SCHEMA_SIMILARITY_H
#define SCHEMA_SIMILARITY_H

#include "core/engine_config.h"
#include "core/field_value.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct UploadedSchema {
  std::vector<std::string> headers;
  std::vector<Row> sampleData;
  size_t rowCount = 0;
};

// One catalog entry that an upload can be matched against.
struct DatasetSchema {
  std::string datasetId;
  std::string datasetName;
  std::string language = "eng";
  std::vector<std::string> fields;
  std::map<std::string, std::string> fieldTypes;
  bool hasGeoFields = false;
  bool hasDateFields = false;

  // Throws std::runtime_error on a malformed entry.
  static DatasetSchema fromJson(const ordered_json &data);
};

struct SimilarityBreakdown {
  int fieldOverlap = 0;
  int typeCompatibility = 0;
  int structureSimilarity = 0;
  int semanticHints = 0;
  int languageMatch = 0;
};

struct SimilarityResult {
  std::string datasetId;
  std::string datasetName;
  int score = 0;
  SimilarityBreakdown breakdown;
  std::vector<std::string> matchingFields;
  std::vector<std::string> missingFields;
  std::vector<std::string> newFields;

  ordered_json toJson() const;
};

struct FieldMatch {
  std::string field;
  double score = 0.0;
};

class SchemaSimilarity {
public:
  static constexpr double FIELD_OVERLAP_WEIGHT = 0.35;
  static constexpr double TYPE_COMPATIBILITY_WEIGHT = 0.25;
  static constexpr double STRUCTURE_WEIGHT = 0.20;
  static constexpr double SEMANTIC_WEIGHT = 0.15;
  static constexpr double LANGUAGE_WEIGHT = 0.05;
  static constexpr double MIN_FUZZY_MATCH = 0.7;
  static constexpr double SYNONYM_SCORE = 0.9;

  SimilarityResult
  calculateSchemaSimilarity(const UploadedSchema &uploaded,
                            const DatasetSchema &dataset,
                            const std::optional<std::string> &detectedLanguage = std::nullopt) const;

  // Scores every catalog entry, keeps those at or above minScore and
  // returns the best maxResults, ties in catalog order.
  std::vector<SimilarityResult> findSimilarDatasets(
      const UploadedSchema &uploaded, const std::vector<DatasetSchema> &catalog,
      const std::optional<std::string> &detectedLanguage = std::nullopt,
      size_t minScore = EngineConfig::getMinSimilarityScore(),
      size_t maxResults = EngineConfig::getMaxSimilarityResults()) const;

  static bool areSynonyms(const std::string &a, const std::string &b);
  static bool areTypesCompatible(const std::string &a, const std::string &b);
  static std::optional<FieldMatch> findBestMatch(const std::string &field,
                                                 const std::vector<std::string> &candidates);
  static std::string classifyValueType(const FieldValue &value);
  static std::string inferFieldType(const std::vector<FieldValue> &values);
};

#endif
