#include "core/engine_config.h"
#include "geo/geo_column_detector.h"
#include "../test_runner.h"

namespace {
Row makeRow(std::initializer_list<std::pair<std::string, FieldValue>> cells) {
  return Row(cells);
}
} // namespace

int main() {
  TestRunner runner;
  EngineConfig::resetToDefaults();
  GeoColumnDetector detector;

  runner.runTest("Separate columns found by name", [&]() {
    std::vector<Row> rows = {
        makeRow({{"lat", FieldValue::floating(40.7128)},
                 {"lon", FieldValue::floating(-74.006)},
                 {"title", FieldValue::string("New York")}}),
        makeRow({{"lat", FieldValue::floating(51.5074)},
                 {"lon", FieldValue::floating(-0.1278)},
                 {"title", FieldValue::string("London")}})};
    auto result = detector.detect({"lat", "lon", "title"}, rows);
    runner.assertTrue(result.found, "found");
    runner.assertTrue(result.type == GeoColumnType::SEPARATE, "separate");
    runner.assertEquals(std::string("lat"), *result.latColumn, "lat column");
    runner.assertEquals(std::string("lon"), *result.lonColumn, "lon column");
    runner.assertTrue(result.detectionMethod == DetectionMethod::PATTERN, "pattern method");
    runner.assertFalse(result.swappedCoordinates, "not swapped");
    runner.assertNear(1.0, result.confidence, 1e-9, "all pairs valid");
  });

  runner.runTest("Swapped columns are flagged", [&]() {
    std::vector<Row> rows = {
        makeRow({{"lat", FieldValue::string("139.65")}, {"lon", FieldValue::string("35.67")}}),
        makeRow({{"lat", FieldValue::string("-122.42")}, {"lon", FieldValue::string("37.77")}}),
        makeRow({{"lat", FieldValue::string("151.21")}, {"lon", FieldValue::string("-33.87")}}),
        makeRow({{"lat", FieldValue::string("-73.99")}, {"lon", FieldValue::string("40.73")}})};
    auto result = detector.detect({"lat", "lon"}, rows);
    runner.assertTrue(result.found, "found");
    runner.assertTrue(result.swappedCoordinates, "swap detected");
    runner.assertNear(1.0, result.confidence, 1e-9, "valid once swapped");
  });

  runner.runTest("Combined column with comma pairs", [&]() {
    std::vector<Row> rows;
    for (const char *value : {"40.7128,-74.0060", "51.5074,-0.1278", "48.8566,2.3522",
                              "35.6762,139.6503", "see map"}) {
      rows.push_back(makeRow({{"name", FieldValue::string("x")},
                              {"coordinates", FieldValue::string(value)}}));
    }
    auto result = detector.detect({"name", "coordinates"}, rows);
    runner.assertTrue(result.found, "found");
    runner.assertTrue(result.type == GeoColumnType::COMBINED, "combined");
    runner.assertEquals(std::string("coordinates"), *result.combinedColumn, "column");
    runner.assertEquals(std::string("combined_comma"), *result.format, "format");
    runner.assertNear(0.8, result.confidence, 1e-9, "4 of 5 values");
  });

  runner.runTest("Heuristic detection without telling headers", [&]() {
    std::vector<Row> rows;
    const std::vector<std::pair<double, double>> points = {
        {40.71, -74.0}, {51.5, -0.12}, {48.85, 2.35}, {35.67, 139.65},
        {-33.86, 151.2}, {37.77, -122.41}};
    for (const auto &[a, b] : points) {
      rows.push_back(makeRow({{"col_a", FieldValue::floating(a)},
                              {"col_b", FieldValue::floating(b)},
                              {"label", FieldValue::string("place")}}));
    }
    auto result = detector.detect({"col_a", "col_b", "label"}, rows);
    runner.assertTrue(result.found, "found by values");
    runner.assertTrue(result.detectionMethod == DetectionMethod::HEURISTIC, "heuristic");
    runner.assertEquals(std::string("col_a"), *result.latColumn, "latitude column");
    runner.assertEquals(std::string("col_b"), *result.lonColumn, "longitude column");
  });

  runner.runTest("Nothing found", [&]() {
    std::vector<Row> rows = {
        makeRow({{"title", FieldValue::string("Concert")}, {"count", FieldValue::integer(3)}})};
    auto result = detector.detect({"title", "count"}, rows);
    runner.assertFalse(result.found, "not found");
    runner.assertTrue(result.type == GeoColumnType::NONE, "type none");
    runner.assertNear(0.0, result.confidence, 1e-9, "zero confidence");
    runner.assertFalse(result.detectionMethod.has_value(), "no method");
  });

  runner.runTest("Named columns with bad values fall through", [&]() {
    std::vector<Row> rows = {
        makeRow({{"latitude", FieldValue::string("unknown")},
                 {"longitude", FieldValue::string("unknown")}})};
    auto result = detector.detect({"latitude", "longitude"}, rows);
    runner.assertFalse(result.found, "unparseable pairs are rejected");
  });

  runner.runTest("Manual selection", [&]() {
    std::vector<Row> rows = {
        makeRow({{"y", FieldValue::floating(52.52)}, {"x", FieldValue::floating(13.405)}}),
        makeRow({{"y", FieldValue::floating(48.13)}, {"x", FieldValue::floating(11.58)}})};
    auto result = detector.validateManualSelection(rows, "y", "x");
    runner.assertTrue(result.found, "manual pair validated");
    runner.assertTrue(result.detectionMethod == DetectionMethod::MANUAL, "manual method");

    runner.assertThrows<std::invalid_argument>(
        [&]() { detector.validateManualSelection(rows, "", "x"); },
        "empty column name rejected");
  });

  runner.runTest("Manual combined column", [&]() {
    std::vector<Row> rows = {
        makeRow({{"where", FieldValue::string("[52.52, 13.405]")}}),
        makeRow({{"where", FieldValue::string("[48.13, 11.58]")}})};
    auto result = detector.validateManualCombined(rows, "where");
    runner.assertTrue(result.found, "combined column validated");
    runner.assertEquals(std::string("brackets"), *result.format, "bracket format");
  });

  runner.runTest("Pair validation ratio can be tightened", [&]() {
    std::vector<Row> rows = {
        makeRow({{"lat", FieldValue::floating(52.52)}, {"lon", FieldValue::floating(13.4)}}),
        makeRow({{"lat", FieldValue::floating(95.0)}, {"lon", FieldValue::floating(200.0)}})};
    runner.assertTrue(detector.validateCoordinatePairs(rows, "lat", "lon").isValid,
                      "half valid passes by default");
    EngineConfig::setPairValidationRatio(0.9);
    runner.assertFalse(detector.validateCoordinatePairs(rows, "lat", "lon").isValid,
                       "half valid fails at 0.9");
    EngineConfig::resetToDefaults();
  });

  runner.printSummary();
  return 0;
}
