#ifndef FIELD_VALUE_H
#define FIELD_VALUE_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using ordered_json = nlohmann::ordered_json;

// A single cell value as it arrives from a parsed spreadsheet row. The set
// of kinds is closed; every detector switches on kind() instead of probing
// the payload.
class FieldValue {
public:
  enum class Kind {
    NULL_VALUE = 0,
    BOOL = 1,
    INTEGER = 2,
    FLOAT = 3,
    STRING = 4,
    DATE = 5,
    ARRAY = 6,
    OBJECT = 7
  };

  struct DateValue {
    int64_t epochMillis = 0;
    bool operator==(const DateValue &other) const {
      return epochMillis == other.epochMillis;
    }
  };

  struct ArrayValue {
    ordered_json items;
    bool operator==(const ArrayValue &other) const {
      return items == other.items;
    }
  };

  struct ObjectValue {
    ordered_json fields;
    bool operator==(const ObjectValue &other) const {
      return fields == other.fields;
    }
  };

  FieldValue() = default;

  static FieldValue null() { return FieldValue(); }
  static FieldValue boolean(bool value);
  static FieldValue integer(int64_t value);
  static FieldValue floating(double value);
  static FieldValue string(std::string value);
  static FieldValue date(int64_t epochMillis);
  static FieldValue array(ordered_json items);
  static FieldValue object(ordered_json fields);

  // Converts a JSON value. An object of the exact form {"$date": "<ISO>"}
  // becomes a DATE; everything else maps onto the matching kind.
  static FieldValue fromJson(const ordered_json &value);
  ordered_json toJson() const;

  Kind kind() const { return static_cast<Kind>(storage_.index()); }
  bool isNull() const { return kind() == Kind::NULL_VALUE; }
  bool isString() const { return kind() == Kind::STRING; }
  bool isNumeric() const {
    return kind() == Kind::INTEGER || kind() == Kind::FLOAT;
  }
  bool isScalar() const {
    return kind() != Kind::ARRAY && kind() != Kind::OBJECT;
  }

  bool asBool() const;
  int64_t asInteger() const;
  double asDouble() const;
  const std::string &asString() const;
  int64_t asDateMillis() const;
  const ordered_json &asJson() const;

  // Text form used by the regex based detectors: strings are returned
  // unchanged, numbers in their shortest JSON spelling, dates as ISO-8601,
  // containers as compact JSON and null as the empty string.
  std::string toDisplayString() const;

  bool operator==(const FieldValue &other) const {
    return storage_ == other.storage_;
  }
  bool operator!=(const FieldValue &other) const { return !(*this == other); }

private:
  using Storage = std::variant<std::monostate, bool, int64_t, double,
                               std::string, DateValue, ArrayValue, ObjectValue>;

  explicit FieldValue(Storage storage) : storage_(std::move(storage)) {}

  Storage storage_;
};

std::string kindToString(FieldValue::Kind kind);

// One logical record: column name -> value, in the column order of the
// source file.
using Row = std::vector<std::pair<std::string, FieldValue>>;

Row rowFromJson(const ordered_json &object);
std::vector<Row> rowsFromJson(const ordered_json &array);
ordered_json rowToJson(const Row &row);

// Value of the named column, or nullptr when the row does not carry it.
const FieldValue *findField(const Row &row, const std::string &column);

#endif
