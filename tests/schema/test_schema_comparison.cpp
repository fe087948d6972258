#include "schema/schema_comparison.h"
#include "../test_runner.h"
#include <stdexcept>

namespace {

StructuralSchema schemaFrom(const std::string &json) {
  return StructuralSchema::fromJson(ordered_json::parse(json));
}

const std::string BASE = R"({
  "type": "object",
  "properties": {
    "id": {"type": "integer"},
    "title": {"type": "string"},
    "status": {"type": "string", "enum": ["open", "closed"]},
    "note": {"type": ["string", "null"]}
  },
  "required": ["id", "title"]
})";

} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Identical schemas", [&]() {
    SchemaComparison result = compareSchemas(schemaFrom(BASE), schemaFrom(BASE));
    runner.assertTrue(result.changes.empty(), "no changes");
    runner.assertFalse(result.isBreaking, "not breaking");
    runner.assertFalse(result.requiresApproval, "no approval");
    runner.assertTrue(result.canAutoApprove, "auto approve");
    runner.assertEquals(std::string("No schema changes detected"),
                        generateChangeSummary(result), "summary");
  });

  runner.runTest("Schema JSON parsing", [&]() {
    StructuralSchema schema = schemaFrom(BASE);
    runner.assertEquals(size_t(4), schema.size(), "four fields");
    runner.assertEquals(2, schema.indexOf("status"), "declaration order");
    runner.assertTrue(schema.find("note")->isNullable(), "union with null");
    runner.assertTrue(schema.find("id")->required, "required list");
    runner.assertEquals(std::string("string"), fieldTypeString(*schema.find("note")),
                        "null left out of the type string");
    runner.assertThrows<std::runtime_error>([&]() { schemaFrom("[1, 2]"); }, "not an object");
  });

  runner.runTest("Change ordering and severities", [&]() {
    StructuralSchema updated = schemaFrom(R"({
      "type": "object",
      "properties": {
        "id": {"type": "string"},
        "title": {"type": "string"},
        "status": {"type": "string", "enum": ["open", "archived"]},
        "note": {"type": ["string", "null"]},
        "owner": {"type": "string"}
      },
      "required": ["id", "note"]
    })");
    SchemaComparison result = compareSchemas(schemaFrom(BASE), updated);

    runner.assertEquals(size_t(5), result.changes.size(), "five changes");
    runner.assertTrue(result.changes[0].type == ChangeType::NEW_FIELD, "addition first");
    runner.assertEquals(std::string("owner"), result.changes[0].path, "added owner");
    runner.assertTrue(result.changes[0].severity == ChangeSeverity::INFO, "optional addition");

    runner.assertTrue(result.changes[1].type == ChangeType::TYPE_CHANGE, "type change");
    runner.assertEquals(std::string("integer"), *result.changes[1].oldType, "old type");
    runner.assertEquals(std::string("string"), *result.changes[1].newType, "new type");

    const SchemaChange &enumChange = result.changes[2];
    runner.assertTrue(enumChange.type == ChangeType::ENUM_CHANGE, "enum change");
    runner.assertEquals(size_t(1), enumChange.addedValues.size(), "one added value");
    runner.assertTrue(enumChange.removedValues.front() == FieldValue::string("closed"),
                      "closed removed");
    runner.assertTrue(enumChange.severity == ChangeSeverity::WARNING, "removal warns");

    runner.assertEquals(std::string("note"), result.changes[3].path, "became required");
    runner.assertTrue(result.changes[3].severity == ChangeSeverity::ERROR, "required errors");
    runner.assertEquals(std::string("title"), result.changes[4].path, "became optional");
    runner.assertTrue(result.changes[4].autoApprovable, "optional is auto approvable");

    runner.assertTrue(result.isBreaking, "breaking");
    runner.assertTrue(result.requiresApproval, "approval needed");
    runner.assertFalse(result.canAutoApprove, "cannot auto approve");
  });

  runner.runTest("Removed and required additions are breaking", [&]() {
    StructuralSchema updated = schemaFrom(R"({
      "type": "object",
      "properties": {
        "id": {"type": "integer"},
        "title": {"type": "string"},
        "status": {"type": "string", "enum": ["open", "closed"]},
        "code": {"type": "string"}
      },
      "required": ["id", "title", "code"]
    })");
    SchemaComparison result = compareSchemas(schemaFrom(BASE), updated);
    runner.assertEquals(size_t(2), result.changes.size(), "two changes");
    runner.assertTrue(result.changes[0].type == ChangeType::REMOVED_FIELD, "removal first");
    runner.assertEquals(std::string("note"), result.changes[0].path, "note removed");
    runner.assertTrue(result.changes[1].severity == ChangeSeverity::ERROR,
                      "required addition errors");
    runner.assertTrue(result.isBreaking, "breaking");

    const std::string summary = generateChangeSummary(result);
    runner.assertTrue(summary.find("Breaking Changes:") != std::string::npos,
                      "breaking section");
    runner.assertTrue(summary.find("Non-Breaking Changes:") == std::string::npos,
                      "no non-breaking section");
  });

  runner.runTest("Enum additions alone are auto approvable", [&]() {
    StructuralSchema updated = schemaFrom(R"({
      "type": "object",
      "properties": {
        "id": {"type": "integer"},
        "title": {"type": "string"},
        "status": {"type": "string", "enum": ["open", "closed", "pending"]},
        "note": {"type": ["string", "null"]}
      },
      "required": ["id", "title"]
    })");
    SchemaComparison result = compareSchemas(schemaFrom(BASE), updated);
    runner.assertEquals(size_t(1), result.changes.size(), "one change");
    runner.assertFalse(result.isBreaking, "not breaking");
    runner.assertFalse(result.requiresApproval, "info only");
    runner.assertTrue(result.canAutoApprove, "auto approve");
    runner.assertEquals(std::string("enum_change"),
                        result.changes.front().toJson()["type"].get<std::string>(),
                        "wire name");
  });

  runner.printSummary();
  return 0;
}
