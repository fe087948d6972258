#include "core/field_value.h"
#include "../test_runner.h"

int main() {
  TestRunner runner;

  runner.runTest("Kinds from JSON", [&]() {
    runner.assertTrue(FieldValue::fromJson(nullptr).isNull(), "null");
    runner.assertTrue(FieldValue::fromJson(true).kind() == FieldValue::Kind::BOOL, "bool");
    runner.assertTrue(FieldValue::fromJson(42).kind() == FieldValue::Kind::INTEGER, "integer");
    runner.assertTrue(FieldValue::fromJson(4.5).kind() == FieldValue::Kind::FLOAT, "float");
    runner.assertTrue(FieldValue::fromJson("x").kind() == FieldValue::Kind::STRING, "string");
    runner.assertTrue(FieldValue::fromJson(ordered_json::array({1, 2})).kind() ==
                          FieldValue::Kind::ARRAY,
                      "array");
    runner.assertTrue(FieldValue::fromJson(ordered_json{{"a", 1}}).kind() ==
                          FieldValue::Kind::OBJECT,
                      "object");
  });

  runner.runTest("Tagged dates", [&]() {
    FieldValue value = FieldValue::fromJson(ordered_json{{"$date", "2024-01-15T00:00:00Z"}});
    runner.assertTrue(value.kind() == FieldValue::Kind::DATE, "tagged object becomes a date");
    runner.assertEquals(int64_t(1705276800000), value.asDateMillis(), "epoch millis");
    runner.assertEquals(std::string("2024-01-15T00:00:00.000Z"), value.toDisplayString(),
                        "display form");

    FieldValue bad = FieldValue::fromJson(ordered_json{{"$date", "not a date"}});
    runner.assertTrue(bad.kind() == FieldValue::Kind::OBJECT, "unparseable tag stays an object");
  });

  runner.runTest("JSON round trip keeps the value", [&]() {
    ordered_json source = ordered_json::parse(
        R"({"b": 2, "a": [1, "two", null], "nested": {"z": true, "y": 1.5}})");
    Row row = rowFromJson(source);
    runner.assertEquals(std::string("b"), row[0].first, "column order preserved");
    runner.assertEquals(std::string("a"), row[1].first, "second column");
    runner.assertEquals(source.dump(), rowToJson(row).dump(), "same document");
  });

  runner.runTest("Typed accessors reject the wrong kind", [&]() {
    FieldValue text = FieldValue::string("abc");
    runner.assertThrows<std::logic_error>([&]() { text.asDouble(); }, "string is not numeric");
    runner.assertThrows<std::logic_error>([&]() { FieldValue::integer(1).asString(); },
                                          "integer is not a string");
    runner.assertNear(3.0, FieldValue::integer(3).asDouble(), 0.0, "integer widens");
  });

  runner.runTest("Rows must be objects", [&]() {
    runner.assertThrows<std::invalid_argument>(
        []() { rowFromJson(ordered_json::array({1})); }, "array row rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { rowsFromJson(ordered_json{{"a", 1}}); }, "object batch rejected");
  });

  runner.runTest("Field lookup", [&]() {
    Row row = rowFromJson(ordered_json{{"title", "Concert"}, {"count", 3}});
    const FieldValue *title = findField(row, "title");
    runner.assertTrue(title != nullptr, "present column");
    runner.assertEquals(std::string("Concert"), title->asString(), "value");
    runner.assertTrue(findField(row, "missing") == nullptr, "absent column");
  });

  runner.runTest("Equality is kind-sensitive", [&]() {
    runner.assertTrue(FieldValue::string("1") != FieldValue::integer(1), "string vs integer");
    runner.assertTrue(FieldValue::integer(7) == FieldValue::integer(7), "same integer");
    runner.assertTrue(FieldValue::null() == FieldValue(), "nulls are equal");
  });

  runner.printSummary();
  return 0;
}
