#include "mapping/mapping_engine.h"
#include "core/logger.h"

SchemaMappingEngine::SchemaMappingEngine(const std::optional<ordered_json> &previousState,
                                         SchemaBuilderConfig config)
    : builder_(makeBuilder(previousState, config)) {}

ProgressiveSchemaBuilder
SchemaMappingEngine::makeBuilder(const std::optional<ordered_json> &previousState,
                                 const SchemaBuilderConfig &config) {
  if (!previousState || previousState->is_null()) {
    return ProgressiveSchemaBuilder(config);
  }
  Logger::info(LogCategory::MAPPING, "SchemaMappingEngine",
               "Restoring builder from previous state");
  return ProgressiveSchemaBuilder::fromState(*previousState, config);
}

BatchResult SchemaMappingEngine::processBatch(const std::vector<Row> &rows) {
  return builder_.processBatch(rows);
}

LanguageDetectionResult SchemaMappingEngine::detectLanguage() const {
  std::vector<std::string> headers;
  for (const auto &stats : builder_.fieldStatistics()) {
    if (stats.depth == 0) {
      headers.push_back(stats.path);
    }
  }
  const std::string text =
      LanguageSupport::extractTextForLanguageDetection(builder_.sampleRows(), headers);
  return LanguageSupport::resolveLanguage(languageDetector_.get(), text);
}

FieldMappingResult
SchemaMappingEngine::detectMappings(const std::optional<std::string> &language) const {
  std::string resolved;
  if (language && !language->empty()) {
    resolved = *language;
  } else {
    resolved = detectLanguage().code;
  }

  Logger::debug(LogCategory::MAPPING, "SchemaMappingEngine::detectMappings",
                "Detecting mappings over " +
                    std::to_string(builder_.fieldStatistics().size()) +
                    " fields, language " + resolved);
  return mappingDetector_.detectFieldMappings(builder_.fieldStatistics(), resolved,
                                              builder_.sampleRows());
}

void SchemaMappingEngine::mergeState(const ordered_json &otherState) {
  SchemaBuilderState other = SchemaBuilderState::fromJson(otherState);
  builder_.mergeState(other);
  Logger::info(LogCategory::MAPPING, "SchemaMappingEngine::mergeState",
               "Merged state with " + std::to_string(other.recordCount) +
                   " records");
}
