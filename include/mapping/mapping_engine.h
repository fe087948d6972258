#ifndef MAPPING_ENGINE_H
#define MAPPING_ENGINE_H

#include "core/field_value.h"
#include "mapping/field_mapping_detector.h"
#include "mapping/language_support.h"
#include "schema/schema_builder.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Entry point for hosts: feeds batches to the schema builder and turns the
// accumulated statistics into field mappings on demand.
class SchemaMappingEngine {
public:
  explicit SchemaMappingEngine(const std::optional<ordered_json> &previousState = std::nullopt,
                               SchemaBuilderConfig config = SchemaBuilderConfig());

  BatchResult processBatch(const std::vector<Row> &rows);

  // An explicit language wins; otherwise the configured detector runs over
  // the sampled text, and English is the last resort.
  FieldMappingResult detectMappings(const std::optional<std::string> &language = std::nullopt) const;

  LanguageDetectionResult detectLanguage() const;

  void setLanguageDetector(std::shared_ptr<const LanguageDetector> detector) {
    languageDetector_ = std::move(detector);
  }

  void mergeState(const ordered_json &otherState);

  ordered_json exportState() const { return builder_.exportState(); }
  const FieldStatsMap &fieldStatistics() const { return builder_.fieldStatistics(); }
  StructuralSchema getSchema() const { return builder_.getSchema(); }
  SchemaSummary getSummary() const { return builder_.getSummary(); }
  const ProgressiveSchemaBuilder &builder() const { return builder_; }

private:
  static ProgressiveSchemaBuilder makeBuilder(const std::optional<ordered_json> &previousState,
                                              const SchemaBuilderConfig &config);

  ProgressiveSchemaBuilder builder_;
  FieldMappingDetector mappingDetector_;
  std::shared_ptr<const LanguageDetector> languageDetector_;
};

#endif
