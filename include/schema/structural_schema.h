#ifndef STRUCTURAL_SCHEMA_H
#define STRUCTURAL_SCHEMA_H

#include "core/field_value.h"
#include <optional>
#include <string>
#include <vector>

struct SchemaField {
  std::string name;
  // JSON-schema type names; more than one is a union, "null" marks the
  // field nullable.
  std::vector<std::string> types;
  bool required = false;
  std::optional<std::vector<FieldValue>> enumValues;
  std::optional<double> minimum;
  std::optional<double> maximum;

  bool isNullable() const;
  std::vector<std::string> nonNullTypes() const;
};

// Ordered field list that reads and writes the JSON-Schema subset
// {"type":"object","properties":{...},"required":[...]}.
class StructuralSchema {
public:
  StructuralSchema() = default;
  explicit StructuralSchema(std::vector<SchemaField> fields);

  void addField(SchemaField field);
  const SchemaField *find(const std::string &name) const;
  bool hasField(const std::string &name) const { return find(name) != nullptr; }

  // Declaration index of a field, or -1.
  int indexOf(const std::string &name) const;

  const std::vector<SchemaField> &fields() const { return fields_; }
  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  ordered_json toJson() const;
  // Throws std::runtime_error when the document is not an object schema.
  static StructuralSchema fromJson(const ordered_json &data);

private:
  std::vector<SchemaField> fields_;
};

#endif
