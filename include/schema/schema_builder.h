#ifndef SCHEMA_BUILDER_H
#define SCHEMA_BUILDER_H

#include "core/engine_config.h"
#include "core/field_value.h"
#include "schema/field_statistics.h"
#include "schema/schema_comparison.h"
#include "schema/structural_schema.h"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct SchemaBuilderConfig {
  size_t maxSamples = EngineConfig::getMaxSamples();
  size_t maxUniqueValues = EngineConfig::getMaxUniqueValues();
  size_t enumThreshold = EngineConfig::getEnumThreshold();
  EnumMode enumMode = EngineConfig::getEnumMode();
  size_t maxDepth = EngineConfig::getMaxDepth();

  // Throws std::invalid_argument on a zero limit.
  void validate() const;
};

struct TypeConflict {
  std::string path;
  std::map<std::string, size_t> types;
  std::vector<std::pair<std::string, FieldValue>> samples;
};

struct DetectedGeoFields {
  std::optional<std::string> latitude;
  std::optional<std::string> longitude;
  double confidence = 0.0;
};

struct SchemaBuilderState {
  size_t version = 0;
  size_t recordCount = 0;
  size_t batchCount = 0;
  FieldStatsMap fieldStats;
  std::deque<Row> dataSamples;
  std::vector<std::string> detectedIdFields;
  DetectedGeoFields detectedGeoFields;
  std::vector<TypeConflict> typeConflicts;
  std::string lastUpdated;

  ordered_json toJson() const;
  // Throws std::runtime_error when the document is not a builder state.
  static SchemaBuilderState fromJson(const ordered_json &data);
};

struct BatchResult {
  bool schemaChanged = false;
  std::vector<SchemaChange> changes;
};

struct SchemaSummary {
  size_t recordCount = 0;
  size_t fieldCount = 0;
  size_t version = 0;
  std::vector<std::string> idFields;
  DetectedGeoFields geoFields;
  std::vector<std::string> enumFields;

  ordered_json toJson() const;
};

// Infers a structural schema incrementally, one batch of rows at a time,
// without holding more than maxSamples rows in memory.
class ProgressiveSchemaBuilder {
public:
  explicit ProgressiveSchemaBuilder(SchemaBuilderConfig config = SchemaBuilderConfig());
  ProgressiveSchemaBuilder(SchemaBuilderState state, SchemaBuilderConfig config);

  BatchResult processBatch(const std::vector<Row> &rows);

  // Folds statistics collected by another builder into this one.
  void mergeState(const SchemaBuilderState &other);

  StructuralSchema getSchema() const;
  SchemaComparison compareWithPrevious(const StructuralSchema &previous) const;
  SchemaSummary getSummary() const;

  const SchemaBuilderState &state() const { return state_; }
  const FieldStatsMap &fieldStatistics() const { return state_.fieldStats; }
  std::vector<Row> sampleRows() const;
  const SchemaBuilderConfig &config() const { return config_; }

  ordered_json exportState() const { return state_.toJson(); }
  static ProgressiveSchemaBuilder fromState(const ordered_json &data,
                                            SchemaBuilderConfig config = SchemaBuilderConfig());

private:
  void processRecord(const Row &record, const std::string &prefix, size_t depth,
                     std::vector<SchemaChange> &changes);
  void processNestedValue(const FieldValue &value, const std::string &path,
                          size_t depth, std::vector<SchemaChange> &changes);
  void recordTypeConflict(const std::string &path, const FieldStatistics &stats,
                          const std::string &newType, const FieldValue &value);
  void appendSamples(const std::vector<Row> &rows);
  void runDetection();
  void detectIdFields();
  void detectGeoFields();
  void detectEnums();

  SchemaBuilderConfig config_;
  SchemaBuilderState state_;
};

#endif
