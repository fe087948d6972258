#include "schema/schema_similarity.h"
#include "../test_runner.h"
#include <stdexcept>

namespace {

UploadedSchema eventUpload() {
  UploadedSchema uploaded;
  uploaded.headers = {"title", "date", "location", "latitude", "longitude"};
  uploaded.sampleData = rowsFromJson(ordered_json::parse(R"([
    {"title": "Concert", "date": "2024-01-15", "location": "Berlin",
     "latitude": 52.52, "longitude": 13.405},
    {"title": "Market", "date": "2024-02-03", "location": "Munich",
     "latitude": 48.14, "longitude": 11.58}
  ])"));
  uploaded.rowCount = 2;
  return uploaded;
}

DatasetSchema eventDataset() {
  DatasetSchema dataset;
  dataset.datasetId = "events";
  dataset.datasetName = "City events";
  dataset.fields = {"title", "date", "location", "latitude", "longitude"};
  dataset.fieldTypes = {{"title", "string"},
                        {"date", "date"},
                        {"location", "string"},
                        {"latitude", "number"},
                        {"longitude", "number"}};
  dataset.hasGeoFields = true;
  dataset.hasDateFields = true;
  return dataset;
}

DatasetSchema inventoryDataset() {
  DatasetSchema dataset;
  dataset.datasetId = "inventory";
  dataset.datasetName = "Inventory";
  dataset.fields = {"price", "quantity", "sku"};
  return dataset;
}

} // namespace

int main() {
  TestRunner runner;
  SchemaSimilarity similarity;

  runner.runTest("Identical schema scores high", [&]() {
    SimilarityResult result =
        similarity.calculateSchemaSimilarity(eventUpload(), eventDataset(), std::string("eng"));
    runner.assertGreaterOrEqual(90, result.score, "near perfect");
    runner.assertEquals(100, result.breakdown.fieldOverlap, "all fields overlap");
    runner.assertEquals(100, result.breakdown.typeCompatibility, "types agree");
    runner.assertEquals(size_t(5), result.matchingFields.size(), "all matching");
    runner.assertTrue(result.missingFields.empty(), "nothing missing");
    runner.assertTrue(result.newFields.empty(), "nothing new");
  });

  runner.runTest("Disjoint schema scores low", [&]() {
    UploadedSchema uploaded;
    uploaded.headers = {"alpha", "beta", "gamma"};
    SimilarityResult result = similarity.calculateSchemaSimilarity(uploaded, inventoryDataset());
    runner.assertTrue(result.score < 50, "below half");
    runner.assertTrue(result.matchingFields.empty(), "no matches");
    runner.assertEquals(size_t(3), result.missingFields.size(), "all target fields missing");
    runner.assertEquals(size_t(3), result.newFields.size(), "all uploaded fields new");
    runner.assertEquals(70, result.breakdown.typeCompatibility, "no declared types");
    runner.assertEquals(50, result.breakdown.languageMatch, "no detected language");
  });

  runner.runTest("Synonyms match", [&]() {
    runner.assertTrue(SchemaSimilarity::areSynonyms("Name", "title"), "name ~ title");
    runner.assertTrue(SchemaSimilarity::areSynonyms("lat", "latitude"), "lat ~ latitude");
    runner.assertFalse(SchemaSimilarity::areSynonyms("lat", "lng"), "different groups");

    UploadedSchema uploaded;
    uploaded.headers = {"name", "desc", "lat", "lng"};
    DatasetSchema dataset;
    dataset.datasetId = "d";
    dataset.fields = {"title", "description", "latitude", "longitude"};
    SimilarityResult result = similarity.calculateSchemaSimilarity(uploaded, dataset);
    runner.assertEquals(size_t(4), result.matchingFields.size(), "every field matched");
    runner.assertEquals(60, result.breakdown.fieldOverlap, "matches without shared names");

    auto match = SchemaSimilarity::findBestMatch("title", {"heading", "Title"});
    runner.assertEquals(std::string("Title"), match->field, "exact beats synonym");
    runner.assertNear(1.0, match->score, 1e-9, "exact score");
  });

  runner.runTest("Value and type classification", [&]() {
    runner.assertEquals(std::string("date"),
                        SchemaSimilarity::classifyValueType(FieldValue::string("12/03/2024")),
                        "slash date");
    runner.assertEquals(std::string("numeric_string"),
                        SchemaSimilarity::classifyValueType(FieldValue::string("12.5")),
                        "numeric text");
    runner.assertEquals(std::string("integer"),
                        SchemaSimilarity::classifyValueType(FieldValue::floating(3.0)),
                        "integral float");
    runner.assertEquals(std::string("string"), SchemaSimilarity::inferFieldType({}),
                        "no values");
    runner.assertEquals(std::string("integer"),
                        SchemaSimilarity::inferFieldType({FieldValue::integer(1), FieldValue::null(),
                                                          FieldValue::integer(2),
                                                          FieldValue::string("x")}),
                        "dominant non-null type");
    runner.assertTrue(SchemaSimilarity::areTypesCompatible("numeric_string", "number"),
                      "numeric text ~ number");
    runner.assertFalse(SchemaSimilarity::areTypesCompatible("boolean", "number"),
                       "boolean vs number");
  });

  runner.runTest("Ranking, threshold and limit", [&]() {
    DatasetSchema partial = eventDataset();
    partial.datasetId = "partial";
    partial.fields = {"title", "date", "organizer"};
    partial.fieldTypes.clear();

    const std::vector<DatasetSchema> catalog = {inventoryDataset(), partial, eventDataset()};
    auto results = similarity.findSimilarDatasets(eventUpload(), catalog, std::string("eng"), 50, 10);
    runner.assertEquals(size_t(2), results.size(), "inventory filtered out");
    runner.assertEquals(std::string("events"), results[0].datasetId, "best first");
    runner.assertEquals(std::string("partial"), results[1].datasetId, "second");
    runner.assertTrue(results[0].score >= results[1].score, "descending");

    auto limited = similarity.findSimilarDatasets(eventUpload(), catalog, std::string("eng"), 0, 1);
    runner.assertEquals(size_t(1), limited.size(), "limited to one");
    runner.assertEquals(std::string("events"), limited[0].datasetId, "still the best");
  });

  runner.runTest("Catalog entries from JSON", [&]() {
    DatasetSchema dataset = DatasetSchema::fromJson(ordered_json::parse(
        R"({"datasetId": 42, "fields": ["a"], "fieldTypes": {"a": "string"}})"));
    runner.assertEquals(std::string("42"), dataset.datasetId, "numeric id as text");
    runner.assertEquals(std::string("42"), dataset.datasetName, "name defaults to id");
    runner.assertEquals(std::string("eng"), dataset.language, "default language");
    runner.assertThrows<std::runtime_error>(
        [&]() { DatasetSchema::fromJson(ordered_json::parse(R"({"fields": []})")); },
        "missing id");
    runner.assertThrows<std::runtime_error>(
        [&]() { DatasetSchema::fromJson(ordered_json::parse("[]")); }, "not an object");
  });

  runner.printSummary();
  return 0;
}
