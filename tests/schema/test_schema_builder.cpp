#include "schema/schema_builder.h"
#include "../test_runner.h"
#include <algorithm>
#include <stdexcept>

namespace {

std::vector<Row> rows(const std::string &jsonArray) {
  return rowsFromJson(ordered_json::parse(jsonArray));
}

SchemaBuilderConfig countEnumConfig() {
  SchemaBuilderConfig config;
  config.enumMode = EnumMode::COUNT;
  config.enumThreshold = 5;
  return config;
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

const std::string EVENTS = R"([
  {"id": 1, "name": "Concert", "status": "open", "latitude": 52.52, "longitude": 13.40},
  {"id": 2, "name": "Market", "status": "open", "latitude": 48.14, "longitude": 11.58},
  {"id": 3, "name": "Festival", "status": "closed", "latitude": 50.94, "longitude": 6.96},
  {"id": 4, "name": "Parade", "status": "open", "latitude": 53.55, "longitude": 9.99},
  {"id": 5, "name": "Fair", "status": "closed", "latitude": 51.34, "longitude": 12.37}
])";

} // namespace

int main() {
  TestRunner runner;

  runner.runTest("First batch reports every field as new", [&]() {
    ProgressiveSchemaBuilder builder(countEnumConfig());
    BatchResult result = builder.processBatch(rows(EVENTS));
    runner.assertTrue(result.schemaChanged, "schema changed");
    runner.assertEquals(size_t(5), result.changes.size(), "one change per column");
    for (const auto &change : result.changes) {
      runner.assertTrue(change.type == ChangeType::NEW_FIELD, "new field " + change.path);
      runner.assertTrue(change.autoApprovable, "auto approvable " + change.path);
    }
    runner.assertEquals(size_t(1), builder.state().version, "version bumped once");
    runner.assertEquals(size_t(5), builder.state().recordCount, "records counted");
  });

  runner.runTest("Type change and versioning", [&]() {
    ProgressiveSchemaBuilder builder;
    builder.processBatch(rows(R"([{"count": 1}])"));
    BatchResult changed = builder.processBatch(rows(R"([{"count": "many"}])"));
    runner.assertEquals(size_t(1), changed.changes.size(), "one change");
    const SchemaChange &change = changed.changes.front();
    runner.assertTrue(change.type == ChangeType::TYPE_CHANGE, "type change");
    runner.assertTrue(change.severity == ChangeSeverity::WARNING, "warning");
    runner.assertEquals(std::string("integer"), *change.oldType, "old type");
    runner.assertEquals(std::string("string"), *change.newType, "new type");
    runner.assertEquals(size_t(2), builder.state().version, "version after change");
    runner.assertEquals(size_t(1), builder.state().typeConflicts.size(), "conflict kept");

    BatchResult same = builder.processBatch(rows(R"([{"count": 2}, {"count": null}])"));
    runner.assertFalse(same.schemaChanged, "known types and null change nothing");
    runner.assertEquals(size_t(2), builder.state().version, "version unchanged");

    const StructuralSchema schema = builder.getSchema();
    const SchemaField *field = schema.find("count");
    runner.assertTrue(field != nullptr, "field present");
    runner.assertEquals(std::string("integer"), field->types.front(), "dominant type first");
    runner.assertEquals(std::string("null"), field->types.back(), "nullable last");
  });

  runner.runTest("Nested paths and depth limit", [&]() {
    const std::string nested =
        R"([{"meta": {"size": 3}, "tags": [{"label": "x"}]}])";
    ProgressiveSchemaBuilder deep;
    deep.processBatch(rows(nested));
    runner.assertTrue(deep.fieldStatistics().contains("meta.size"), "object child");
    runner.assertTrue(deep.fieldStatistics().contains("tags[].label"), "array item child");
    runner.assertEquals(size_t(1), deep.fieldStatistics().find("meta.size")->depth, "depth");
    runner.assertFalse(deep.getSchema().find("meta.size")->required,
                       "nested fields are never required");

    SchemaBuilderConfig shallowConfig;
    shallowConfig.maxDepth = 1;
    ProgressiveSchemaBuilder shallow(shallowConfig);
    shallow.processBatch(rows(nested));
    runner.assertEquals(size_t(2), shallow.fieldStatistics().size(), "top level only");
  });

  runner.runTest("Required fields", [&]() {
    ProgressiveSchemaBuilder builder;
    builder.processBatch(rows(R"([
      {"always": 1, "sometimes": 1}, {"always": 2}, {"always": 3, "sometimes": 3},
      {"always": 4}
    ])"));
    StructuralSchema schema = builder.getSchema();
    runner.assertTrue(schema.find("always")->required, "present in every row");
    runner.assertFalse(schema.find("sometimes")->required, "present in half");
  });

  runner.runTest("ID, enum and geo detection", [&]() {
    ProgressiveSchemaBuilder builder(countEnumConfig());
    builder.processBatch(rows(EVENTS));
    SchemaSummary summary = builder.getSummary();
    runner.assertTrue(contains(summary.idFields, "id"), "id detected");
    runner.assertFalse(contains(summary.idFields, "name"), "name is not an id");
    runner.assertTrue(contains(summary.enumFields, "status"), "status is an enum");
    runner.assertFalse(contains(summary.enumFields, "name"), "all-distinct is not an enum");
    runner.assertEquals(std::string("latitude"), summary.geoFields.latitude.value_or(""),
                        "latitude column");
    runner.assertEquals(std::string("longitude"), summary.geoFields.longitude.value_or(""),
                        "longitude column");
    runner.assertTrue(summary.geoFields.confidence > 0.0, "geo confidence");

    const StructuralSchema schema = builder.getSchema();
    const SchemaField *status = schema.find("status");
    runner.assertTrue(status->enumValues.has_value(), "enum emitted in schema");
    runner.assertEquals(size_t(2), status->enumValues->size(), "two enum values");

    ordered_json json = summary.toJson();
    runner.assertTrue(json["detectedPatterns"].contains("enumFields"), "summary layout");
  });

  runner.runTest("Duplicate ids are not ids", [&]() {
    ProgressiveSchemaBuilder builder;
    builder.processBatch(rows(R"([{"user_id": 1}, {"user_id": 1}, {"user_id": 2}])"));
    runner.assertTrue(builder.getSummary().idFields.empty(), "repeated value");
  });

  runner.runTest("Sample rows rotate", [&]() {
    SchemaBuilderConfig config;
    config.maxSamples = 3;
    ProgressiveSchemaBuilder builder(config);
    builder.processBatch(rows(R"([{"n": 1}, {"n": 2}, {"n": 3}, {"n": 4}, {"n": 5}])"));
    std::vector<Row> samples = builder.sampleRows();
    runner.assertEquals(size_t(3), samples.size(), "bounded");
    runner.assertEquals(int64_t(3), findField(samples.front(), "n")->asInteger(),
                        "oldest rows dropped");
    runner.assertEquals(size_t(5), builder.state().recordCount, "all rows counted");
  });

  runner.runTest("Export and restore", [&]() {
    ProgressiveSchemaBuilder builder(countEnumConfig());
    builder.processBatch(rows(EVENTS));
    ordered_json exported = builder.exportState();

    ProgressiveSchemaBuilder restored =
        ProgressiveSchemaBuilder::fromState(exported, countEnumConfig());
    runner.assertEquals(builder.state().recordCount, restored.state().recordCount, "records");
    runner.assertEquals(builder.state().version, restored.state().version, "version");
    runner.assertTrue(builder.getSchema().toJson() == restored.getSchema().toJson(),
                      "same schema");

    BatchResult next = restored.processBatch(
        rows(R"([{"id": 6, "name": "Fete", "status": "open", "latitude": 1.5, "longitude": 2.5}])"));
    runner.assertFalse(next.schemaChanged, "known fields stay known");

    runner.assertThrows<std::runtime_error>(
        [&]() { ProgressiveSchemaBuilder::fromState(ordered_json::array()); }, "not a state");
  });

  runner.runTest("Merge state from another builder", [&]() {
    ProgressiveSchemaBuilder left;
    left.processBatch(rows(R"([{"a": 1}])"));
    ProgressiveSchemaBuilder right;
    right.processBatch(rows(R"([{"a": 2, "b": "x"}])"));

    left.mergeState(right.state());
    runner.assertEquals(size_t(2), left.state().recordCount, "records add");
    runner.assertEquals(size_t(2), left.fieldStatistics().size(), "fields united");
    runner.assertEquals(size_t(2), left.fieldStatistics().find("a")->occurrences,
                        "occurrences add");
    runner.assertEquals(size_t(2), left.state().version, "version bumped on new fields");
  });

  runner.runTest("Invalid configuration", [&]() {
    SchemaBuilderConfig config;
    config.maxSamples = 0;
    runner.assertThrows<std::invalid_argument>(
        [&]() { ProgressiveSchemaBuilder builder(config); }, "zero samples");
  });

  runner.printSummary();
  return 0;
}
