#include "schema/transform_detector.h"
#include "../test_runner.h"
#include <stdexcept>

namespace {

StructuralSchema schemaWith(const std::vector<std::pair<std::string, std::string>> &fields) {
  std::vector<SchemaField> list;
  for (const auto &[name, type] : fields) {
    SchemaField field;
    field.name = name;
    field.types = {type};
    list.push_back(field);
  }
  return StructuralSchema(list);
}

std::vector<TransformSuggestion> detect(const StructuralSchema &oldSchema,
                                        const StructuralSchema &newSchema) {
  const SchemaComparison comparison = compareSchemas(oldSchema, newSchema);
  return TransformDetector().detectTransforms(oldSchema, newSchema, comparison.changes);
}

} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Prefixed rename at the same position", [&]() {
    auto suggestions =
        detect(schemaWith({{"id", "integer"}, {"date", "string"}, {"title", "string"}}),
               schemaWith({{"id", "integer"}, {"start_date", "string"}, {"title", "string"}}));
    runner.assertEquals(size_t(1), suggestions.size(), "one suggestion");
    runner.assertEquals(std::string("rename"), suggestions[0].type, "rename");
    runner.assertEquals(std::string("start_date"), suggestions[0].from, "new name");
    runner.assertEquals(std::string("date"), suggestions[0].to, "old name");
    runner.assertEquals(94, suggestions[0].confidence, "pattern, type and position");
    runner.assertFalse(suggestions[0].reason.empty(), "reason given");
  });

  runner.runTest("Common rename patterns", [&]() {
    const std::vector<std::pair<std::string, std::string>> pairs = {
        {"time", "start_time"}, {"date", "end_date"}, {"author", "author_name"},
        {"title", "event_title"}};
    for (const auto &[oldName, newName] : pairs) {
      auto suggestions = detect(schemaWith({{oldName, "string"}}),
                                schemaWith({{newName, "string"}}));
      runner.assertEquals(size_t(1), suggestions.size(), oldName + " -> " + newName);
      if (!suggestions.empty()) {
        runner.assertGreaterOrEqual(70, suggestions[0].confidence, oldName + " confidence");
      }
    }
  });

  runner.runTest("Unrelated names are not renames", [&]() {
    auto suggestions = detect(schemaWith({{"date", "string"}}),
                              schemaWith({{"location", "string"}}));
    runner.assertTrue(suggestions.empty(), "no suggestion");
    runner.assertTrue(TransformDetector::nameScore("date", "location") < 0.5, "low name score");
  });

  runner.runTest("Incompatible types stay below the strong threshold", [&]() {
    auto suggestions = detect(schemaWith({{"count", "integer"}}),
                              schemaWith({{"count_items", "object"}}));
    for (const auto &suggestion : suggestions) {
      runner.assertTrue(suggestion.confidence < 70, "weak at best");
    }
  });

  runner.runTest("Multiple renames claim distinct fields", [&]() {
    auto suggestions = detect(
        schemaWith({{"date", "string"}, {"author", "string"}, {"title", "string"}}),
        schemaWith({{"start_date", "string"}, {"creator", "string"}, {"event_title", "string"}}));
    runner.assertEquals(size_t(2), suggestions.size(), "two renames");
    bool sawDate = false;
    bool sawTitle = false;
    for (const auto &suggestion : suggestions) {
      sawDate = sawDate || (suggestion.to == "date" && suggestion.from == "start_date");
      sawTitle = sawTitle || (suggestion.to == "title" && suggestion.from == "event_title");
    }
    runner.assertTrue(sawDate, "date renamed");
    runner.assertTrue(sawTitle, "title renamed");
  });

  runner.runTest("Nothing removed or nothing added", [&]() {
    StructuralSchema base = schemaWith({{"id", "integer"}});
    runner.assertTrue(detect(base, base).empty(), "no changes");
    runner.assertTrue(detect(base, schemaWith({{"id", "integer"}, {"extra", "string"}})).empty(),
                      "additions only");
  });

  runner.runTest("Letter case rename", [&]() {
    auto suggestions = detect(schemaWith({{"Date", "string"}}), schemaWith({{"date", "string"}}));
    runner.assertEquals(size_t(1), suggestions.size(), "one suggestion");
    runner.assertGreaterOrEqual(80, suggestions[0].confidence, "high confidence");
  });

  runner.runTest("Nullable and integer types are compatible", [&]() {
    SchemaField email;
    email.name = "email";
    email.types = {"string"};
    SchemaField userEmail;
    userEmail.name = "user_email";
    userEmail.types = {"string", "null"};
    auto suggestions = detect(StructuralSchema({email}), StructuralSchema({userEmail}));
    runner.assertEquals(size_t(1), suggestions.size(), "suggested");
    runner.assertGreaterOrEqual(50, suggestions[0].confidence, "contains plus types");

    SchemaField integer;
    integer.types = {"integer"};
    SchemaField number;
    number.types = {"number", "null"};
    runner.assertTrue(TransformDetector::typesCompatible(&integer, &number), "integer ~ number");
  });

  runner.runTest("Boolean to string rename keeps the type bonus", [&]() {
    auto suggestions = detect(schemaWith({{"id", "integer"}, {"active", "boolean"}}),
                              schemaWith({{"is_active", "string"}, {"id", "integer"}}));
    runner.assertEquals(size_t(1), suggestions.size(), "suggested");
    if (!suggestions.empty()) {
      runner.assertEquals(std::string("active"), suggestions[0].to, "old name");
      runner.assertEquals(73, suggestions[0].confidence, "contains plus types");
    }

    SchemaField flag;
    flag.types = {"boolean"};
    SchemaField text;
    text.types = {"string"};
    SchemaField nested;
    nested.types = {"object"};
    runner.assertTrue(TransformDetector::typesCompatible(&flag, &text), "boolean ~ string");
    runner.assertFalse(TransformDetector::typesCompatible(&flag, &nested), "boolean vs object");
  });

  runner.runTest("Threshold is validated", [&]() {
    runner.assertThrows<std::invalid_argument>([&]() { TransformDetector detector(101); },
                                               "above 100");
  });

  runner.printSummary();
  return 0;
}
