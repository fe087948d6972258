#ifndef TRANSFORM_DETECTOR_H
#define TRANSFORM_DETECTOR_H

#include "core/engine_config.h"
#include "schema/schema_comparison.h"
#include "schema/structural_schema.h"
#include <string>
#include <vector>

// A field that disappeared and a field that appeared are likely the same
// column under a new name. from is the new name, to the old one.
struct TransformSuggestion {
  std::string type = "rename";
  std::string from;
  std::string to;
  int confidence = 0;
  std::string reason;

  ordered_json toJson() const;
};

class TransformDetector {
public:
  static constexpr double MIN_RENAME_NAME_SCORE = 0.5;

  explicit TransformDetector(
      size_t minConfidence = EngineConfig::getMinRenameConfidence());

  // Pairs removed fields with added fields. Every field takes part in at
  // most one suggestion; the strongest candidates claim their fields first.
  std::vector<TransformSuggestion>
  detectTransforms(const StructuralSchema &oldSchema,
                   const StructuralSchema &newSchema,
                   const std::vector<SchemaChange> &changes) const;

  static double nameScore(const std::string &oldName, const std::string &newName);
  static bool typesCompatible(const SchemaField *oldField,
                              const SchemaField *newField);

private:
  size_t minConfidence_;
};

#endif
