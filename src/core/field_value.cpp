#include "core/field_value.h"
#include "utils/time_utils.h"
#include <stdexcept>

FieldValue FieldValue::boolean(bool value) { return FieldValue(Storage(value)); }

FieldValue FieldValue::integer(int64_t value) {
  return FieldValue(Storage(value));
}

FieldValue FieldValue::floating(double value) {
  return FieldValue(Storage(value));
}

FieldValue FieldValue::string(std::string value) {
  return FieldValue(Storage(std::move(value)));
}

FieldValue FieldValue::date(int64_t epochMillis) {
  return FieldValue(Storage(DateValue{epochMillis}));
}

FieldValue FieldValue::array(ordered_json items) {
  if (!items.is_array()) {
    throw std::invalid_argument("FieldValue::array requires a JSON array");
  }
  return FieldValue(Storage(ArrayValue{std::move(items)}));
}

FieldValue FieldValue::object(ordered_json fields) {
  if (!fields.is_object()) {
    throw std::invalid_argument("FieldValue::object requires a JSON object");
  }
  return FieldValue(Storage(ObjectValue{std::move(fields)}));
}

FieldValue FieldValue::fromJson(const ordered_json &value) {
  switch (value.type()) {
  case ordered_json::value_t::null:
  case ordered_json::value_t::discarded:
    return null();
  case ordered_json::value_t::boolean:
    return boolean(value.get<bool>());
  case ordered_json::value_t::number_integer:
    return integer(value.get<int64_t>());
  case ordered_json::value_t::number_unsigned: {
    uint64_t u = value.get<uint64_t>();
    if (u > static_cast<uint64_t>(INT64_MAX)) {
      return floating(static_cast<double>(u));
    }
    return integer(static_cast<int64_t>(u));
  }
  case ordered_json::value_t::number_float:
    return floating(value.get<double>());
  case ordered_json::value_t::string:
    return string(value.get<std::string>());
  case ordered_json::value_t::array:
    return array(value);
  case ordered_json::value_t::object:
    if (value.size() == 1 && value.contains("$date") &&
        value["$date"].is_string()) {
      if (auto millis = TimeUtils::parseIsoDate(value["$date"].get<std::string>())) {
        return date(*millis);
      }
    }
    return object(value);
  default:
    return string(value.dump());
  }
}

ordered_json FieldValue::toJson() const {
  switch (kind()) {
  case Kind::NULL_VALUE:
    return nullptr;
  case Kind::BOOL:
    return std::get<bool>(storage_);
  case Kind::INTEGER:
    return std::get<int64_t>(storage_);
  case Kind::FLOAT:
    return std::get<double>(storage_);
  case Kind::STRING:
    return std::get<std::string>(storage_);
  case Kind::DATE:
    return ordered_json{
        {"$date",
         TimeUtils::formatIsoDate(std::get<DateValue>(storage_).epochMillis)}};
  case Kind::ARRAY:
    return std::get<ArrayValue>(storage_).items;
  case Kind::OBJECT:
    return std::get<ObjectValue>(storage_).fields;
  }
  return nullptr;
}

bool FieldValue::asBool() const {
  if (kind() != Kind::BOOL) {
    throw std::logic_error("FieldValue is " + kindToString(kind()) +
                           ", not bool");
  }
  return std::get<bool>(storage_);
}

int64_t FieldValue::asInteger() const {
  if (kind() != Kind::INTEGER) {
    throw std::logic_error("FieldValue is " + kindToString(kind()) +
                           ", not integer");
  }
  return std::get<int64_t>(storage_);
}

double FieldValue::asDouble() const {
  if (kind() == Kind::INTEGER) {
    return static_cast<double>(std::get<int64_t>(storage_));
  }
  if (kind() == Kind::FLOAT) {
    return std::get<double>(storage_);
  }
  throw std::logic_error("FieldValue is " + kindToString(kind()) +
                         ", not numeric");
}

const std::string &FieldValue::asString() const {
  if (kind() != Kind::STRING) {
    throw std::logic_error("FieldValue is " + kindToString(kind()) +
                           ", not string");
  }
  return std::get<std::string>(storage_);
}

int64_t FieldValue::asDateMillis() const {
  if (kind() != Kind::DATE) {
    throw std::logic_error("FieldValue is " + kindToString(kind()) +
                           ", not date");
  }
  return std::get<DateValue>(storage_).epochMillis;
}

const ordered_json &FieldValue::asJson() const {
  if (kind() == Kind::ARRAY) {
    return std::get<ArrayValue>(storage_).items;
  }
  if (kind() == Kind::OBJECT) {
    return std::get<ObjectValue>(storage_).fields;
  }
  throw std::logic_error("FieldValue is " + kindToString(kind()) +
                         ", not a container");
}

std::string FieldValue::toDisplayString() const {
  switch (kind()) {
  case Kind::NULL_VALUE:
    return "";
  case Kind::STRING:
    return std::get<std::string>(storage_);
  case Kind::DATE:
    return TimeUtils::formatIsoDate(std::get<DateValue>(storage_).epochMillis);
  default:
    return toJson().dump();
  }
}

std::string kindToString(FieldValue::Kind kind) {
  switch (kind) {
  case FieldValue::Kind::NULL_VALUE:
    return "null";
  case FieldValue::Kind::BOOL:
    return "bool";
  case FieldValue::Kind::INTEGER:
    return "integer";
  case FieldValue::Kind::FLOAT:
    return "float";
  case FieldValue::Kind::STRING:
    return "string";
  case FieldValue::Kind::DATE:
    return "date";
  case FieldValue::Kind::ARRAY:
    return "array";
  case FieldValue::Kind::OBJECT:
    return "object";
  }
  return "unknown";
}

Row rowFromJson(const ordered_json &object) {
  if (!object.is_object()) {
    throw std::invalid_argument("Row must be a JSON object, got " +
                                std::string(object.type_name()));
  }
  Row row;
  row.reserve(object.size());
  for (auto it = object.begin(); it != object.end(); ++it) {
    row.emplace_back(it.key(), FieldValue::fromJson(it.value()));
  }
  return row;
}

std::vector<Row> rowsFromJson(const ordered_json &array) {
  if (!array.is_array()) {
    throw std::invalid_argument("Rows must be a JSON array, got " +
                                std::string(array.type_name()));
  }
  std::vector<Row> rows;
  rows.reserve(array.size());
  for (const auto &item : array) {
    rows.push_back(rowFromJson(item));
  }
  return rows;
}

ordered_json rowToJson(const Row &row) {
  ordered_json object = ordered_json::object();
  for (const auto &[column, value] : row) {
    object[column] = value.toJson();
  }
  return object;
}

const FieldValue *findField(const Row &row, const std::string &column) {
  for (const auto &entry : row) {
    if (entry.first == column) {
      return &entry.second;
    }
  }
  return nullptr;
}
