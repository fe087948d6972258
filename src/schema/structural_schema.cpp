#include "schema/structural_schema.h"
#include <algorithm>
#include <stdexcept>

bool SchemaField::isNullable() const {
  return std::find(types.begin(), types.end(), "null") != types.end();
}

std::vector<std::string> SchemaField::nonNullTypes() const {
  std::vector<std::string> result;
  for (const auto &type : types) {
    if (type != "null") {
      result.push_back(type);
    }
  }
  return result;
}

StructuralSchema::StructuralSchema(std::vector<SchemaField> fields) {
  for (auto &field : fields) {
    addField(std::move(field));
  }
}

void StructuralSchema::addField(SchemaField field) {
  if (field.name.empty()) {
    throw std::invalid_argument("Schema field name must not be empty");
  }
  if (hasField(field.name)) {
    throw std::invalid_argument("Duplicate schema field '" + field.name + "'");
  }
  fields_.push_back(std::move(field));
}

const SchemaField *StructuralSchema::find(const std::string &name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&](const SchemaField &f) { return f.name == name; });
  return it == fields_.end() ? nullptr : &*it;
}

int StructuralSchema::indexOf(const std::string &name) const {
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

ordered_json StructuralSchema::toJson() const {
  ordered_json properties = ordered_json::object();
  ordered_json required = ordered_json::array();

  for (const auto &field : fields_) {
    ordered_json property = ordered_json::object();
    if (field.types.size() == 1) {
      property["type"] = field.types.front();
    } else if (!field.types.empty()) {
      property["type"] = field.types;
    }
    if (field.enumValues) {
      property["enum"] = ordered_json::array();
      for (const auto &value : *field.enumValues) {
        property["enum"].push_back(value.toJson());
      }
    }
    if (field.minimum) {
      property["minimum"] = *field.minimum;
    }
    if (field.maximum) {
      property["maximum"] = *field.maximum;
    }
    properties[field.name] = std::move(property);
    if (field.required) {
      required.push_back(field.name);
    }
  }

  ordered_json out;
  out["type"] = "object";
  out["properties"] = std::move(properties);
  out["required"] = std::move(required);
  return out;
}

StructuralSchema StructuralSchema::fromJson(const ordered_json &data) {
  if (!data.is_object()) {
    throw std::runtime_error("Schema must be a JSON object");
  }

  StructuralSchema schema;
  if (!data.contains("properties")) {
    return schema;
  }
  const auto &properties = data["properties"];
  if (!properties.is_object()) {
    throw std::runtime_error("Schema 'properties' must be an object");
  }

  std::vector<std::string> required;
  if (data.contains("required") && data["required"].is_array()) {
    for (const auto &name : data["required"]) {
      if (name.is_string()) {
        required.push_back(name.get<std::string>());
      }
    }
  }

  for (auto it = properties.begin(); it != properties.end(); ++it) {
    SchemaField field;
    field.name = it.key();
    if (field.name.empty()) {
      throw std::runtime_error("Schema property names must not be empty");
    }
    const auto &property = it.value();
    if (!property.is_object()) {
      throw std::runtime_error("Schema property '" + field.name +
                               "' must be an object");
    }

    if (property.contains("type")) {
      const auto &type = property["type"];
      if (type.is_string()) {
        field.types.push_back(type.get<std::string>());
      } else if (type.is_array()) {
        for (const auto &entry : type) {
          if (!entry.is_string()) {
            throw std::runtime_error("Type list of '" + field.name +
                                     "' must hold strings");
          }
          field.types.push_back(entry.get<std::string>());
        }
      } else {
        throw std::runtime_error("Type of '" + field.name +
                                 "' must be a string or list");
      }
    }

    if (property.contains("enum") && property["enum"].is_array()) {
      std::vector<FieldValue> values;
      for (const auto &value : property["enum"]) {
        values.push_back(FieldValue::fromJson(value));
      }
      field.enumValues = std::move(values);
    }
    if (property.contains("minimum") && property["minimum"].is_number()) {
      field.minimum = property["minimum"].get<double>();
    }
    if (property.contains("maximum") && property["maximum"].is_number()) {
      field.maximum = property["maximum"].get<double>();
    }
    field.required =
        std::find(required.begin(), required.end(), field.name) != required.end();
    schema.addField(std::move(field));
  }
  return schema;
}
