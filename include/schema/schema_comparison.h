#ifndef SCHEMA_COMPARISON_H
#define SCHEMA_COMPARISON_H

#include "core/field_value.h"
#include "schema/structural_schema.h"
#include <optional>
#include <string>
#include <vector>

enum class ChangeType {
  NEW_FIELD,
  REMOVED_FIELD,
  TYPE_CHANGE,
  ENUM_CHANGE,
  FORMAT_CHANGE
};

enum class ChangeSeverity { INFO, WARNING, ERROR };

struct SchemaChange {
  ChangeType type = ChangeType::NEW_FIELD;
  std::string path;
  std::string description;
  ChangeSeverity severity = ChangeSeverity::INFO;
  bool autoApprovable = false;
  std::optional<std::string> oldType;
  std::optional<std::string> newType;
  std::vector<FieldValue> addedValues;
  std::vector<FieldValue> removedValues;

  ordered_json toJson() const;
};

struct SchemaComparison {
  std::vector<SchemaChange> changes;
  bool isBreaking = false;
  bool requiresApproval = false;
  bool canAutoApprove = true;

  ordered_json toJson() const;
};

std::string changeTypeToString(ChangeType type);
std::string changeSeverityToString(ChangeSeverity severity);

// Non-null types joined with " | ", or "unknown" when the field has none.
std::string fieldTypeString(const SchemaField &field);

SchemaComparison compareSchemas(const StructuralSchema &oldSchema,
                                const StructuralSchema &newSchema);

std::string generateChangeSummary(const SchemaComparison &comparison);

#endif
