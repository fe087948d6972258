#include "schema/schema_comparison.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <sstream>

namespace {

bool containsValue(const std::vector<FieldValue> &values,
                   const FieldValue &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

SchemaChange makeChange(ChangeType type, const std::string &path,
                        std::string description, ChangeSeverity severity,
                        bool autoApprovable) {
  SchemaChange change;
  change.type = type;
  change.path = path;
  change.description = std::move(description);
  change.severity = severity;
  change.autoApprovable = autoApprovable;
  return change;
}

ordered_json valuesToJson(const std::vector<FieldValue> &values) {
  ordered_json out = ordered_json::array();
  for (const auto &value : values) {
    out.push_back(value.toJson());
  }
  return out;
}

} // namespace

std::string changeTypeToString(ChangeType type) {
  switch (type) {
  case ChangeType::NEW_FIELD:
    return "new_field";
  case ChangeType::REMOVED_FIELD:
    return "removed_field";
  case ChangeType::TYPE_CHANGE:
    return "type_change";
  case ChangeType::ENUM_CHANGE:
    return "enum_change";
  case ChangeType::FORMAT_CHANGE:
    return "format_change";
  }
  return "unknown";
}

std::string changeSeverityToString(ChangeSeverity severity) {
  switch (severity) {
  case ChangeSeverity::INFO:
    return "info";
  case ChangeSeverity::WARNING:
    return "warning";
  case ChangeSeverity::ERROR:
    return "error";
  }
  return "unknown";
}

std::string fieldTypeString(const SchemaField &field) {
  std::vector<std::string> types = field.nonNullTypes();
  if (types.empty()) {
    return "unknown";
  }
  return StringUtils::join(types, " | ");
}

ordered_json SchemaChange::toJson() const {
  ordered_json out;
  out["type"] = changeTypeToString(type);
  out["path"] = path;
  out["description"] = description;
  out["severity"] = changeSeverityToString(severity);
  out["autoApprovable"] = autoApprovable;
  if (oldType) {
    out["oldType"] = *oldType;
  }
  if (newType) {
    out["newType"] = *newType;
  }
  if (type == ChangeType::ENUM_CHANGE) {
    out["added"] = valuesToJson(addedValues);
    out["removed"] = valuesToJson(removedValues);
  }
  return out;
}

ordered_json SchemaComparison::toJson() const {
  ordered_json out;
  out["changes"] = ordered_json::array();
  for (const auto &change : changes) {
    out["changes"].push_back(change.toJson());
  }
  out["isBreaking"] = isBreaking;
  out["requiresApproval"] = requiresApproval;
  out["canAutoApprove"] = canAutoApprove;
  return out;
}

// Changes are reported in a fixed order: removals, additions, then
// per-field type or enum differences, then requiredness flips.
SchemaComparison compareSchemas(const StructuralSchema &oldSchema,
                                const StructuralSchema &newSchema) {
  SchemaComparison result;

  for (const auto &field : oldSchema.fields()) {
    if (!newSchema.hasField(field.name)) {
      result.changes.push_back(makeChange(
          ChangeType::REMOVED_FIELD, field.name,
          "Field '" + field.name + "' was removed", ChangeSeverity::ERROR, false));
      result.isBreaking = true;
    }
  }

  for (const auto &field : newSchema.fields()) {
    if (oldSchema.hasField(field.name)) {
      continue;
    }
    std::string description = "Field '" + field.name + "' was added";
    if (field.required) {
      description += " (required)";
      result.isBreaking = true;
    }
    result.changes.push_back(makeChange(
        ChangeType::NEW_FIELD, field.name, description,
        field.required ? ChangeSeverity::ERROR : ChangeSeverity::INFO,
        !field.required));
  }

  for (const auto &oldField : oldSchema.fields()) {
    const SchemaField *newField = newSchema.find(oldField.name);
    if (newField == nullptr) {
      continue;
    }

    const std::string oldType = fieldTypeString(oldField);
    const std::string newType = fieldTypeString(*newField);
    if (oldType != newType) {
      SchemaChange change = makeChange(
          ChangeType::TYPE_CHANGE, oldField.name,
          "Field '" + oldField.name + "' type changed from " + oldType +
              " to " + newType,
          ChangeSeverity::ERROR, false);
      change.oldType = oldType;
      change.newType = newType;
      result.changes.push_back(std::move(change));
      result.isBreaking = true;
      continue;
    }

    if (!oldField.enumValues || !newField->enumValues) {
      continue;
    }
    std::vector<FieldValue> added;
    std::vector<FieldValue> removed;
    for (const auto &value : *newField->enumValues) {
      if (!containsValue(*oldField.enumValues, value)) {
        added.push_back(value);
      }
    }
    for (const auto &value : *oldField.enumValues) {
      if (!containsValue(*newField->enumValues, value)) {
        removed.push_back(value);
      }
    }
    if (added.empty() && removed.empty()) {
      continue;
    }
    SchemaChange change = makeChange(
        ChangeType::ENUM_CHANGE, oldField.name,
        "Enum values changed for '" + oldField.name + "'",
        removed.empty() ? ChangeSeverity::INFO : ChangeSeverity::WARNING,
        removed.empty());
    change.addedValues = std::move(added);
    change.removedValues = std::move(removed);
    if (!change.removedValues.empty()) {
      result.isBreaking = true;
    }
    result.changes.push_back(std::move(change));
  }

  for (const auto &newField : newSchema.fields()) {
    const SchemaField *oldField = oldSchema.find(newField.name);
    if (oldField != nullptr && newField.required && !oldField->required) {
      result.changes.push_back(makeChange(
          ChangeType::FORMAT_CHANGE, newField.name,
          "Field '" + newField.name + "' became required",
          ChangeSeverity::ERROR, false));
      result.isBreaking = true;
    }
  }

  for (const auto &oldField : oldSchema.fields()) {
    const SchemaField *newField = newSchema.find(oldField.name);
    if (newField != nullptr && oldField.required && !newField->required) {
      result.changes.push_back(makeChange(
          ChangeType::FORMAT_CHANGE, oldField.name,
          "Field '" + oldField.name + "' became optional",
          ChangeSeverity::INFO, true));
    }
  }

  result.requiresApproval =
      std::any_of(result.changes.begin(), result.changes.end(),
                  [](const SchemaChange &c) {
                    return c.severity != ChangeSeverity::INFO;
                  });
  result.canAutoApprove =
      std::all_of(result.changes.begin(), result.changes.end(),
                  [](const SchemaChange &c) { return c.autoApprovable; });
  return result;
}

std::string generateChangeSummary(const SchemaComparison &comparison) {
  if (comparison.changes.empty()) {
    return "No schema changes detected";
  }

  std::ostringstream out;
  out << "Schema Changes Summary:\n";
  out << "- Total changes: " << comparison.changes.size() << "\n";
  out << "- Breaking changes: " << (comparison.isBreaking ? "Yes" : "No") << "\n";
  out << "- Requires approval: " << (comparison.requiresApproval ? "Yes" : "No")
      << "\n";
  out << "- Can auto-approve: " << (comparison.canAutoApprove ? "Yes" : "No");

  bool header = false;
  for (const auto &change : comparison.changes) {
    if (change.severity != ChangeSeverity::ERROR) {
      continue;
    }
    if (!header) {
      out << "\n\nBreaking Changes:";
      header = true;
    }
    out << "\n  - " << change.description;
  }

  header = false;
  for (const auto &change : comparison.changes) {
    if (change.severity == ChangeSeverity::ERROR) {
      continue;
    }
    if (!header) {
      out << "\n\nNon-Breaking Changes:";
      header = true;
    }
    out << "\n  - " << change.description;
  }

  return out.str();
}
