#include "geo/coordinate_validator.h"
#include "../test_runner.h"

int main() {
  TestRunner runner;
  CoordinateValidator validator;

  runner.runTest("Valid coordinates", [&]() {
    auto result = validator.validateCoordinates(51.5074, -0.1278);
    runner.assertTrue(result.isValid, "London is valid");
    runner.assertTrue(result.validationStatus == ValidationStatus::VALID, "status valid");
    runner.assertNear(1.0, result.confidence, 1e-9, "full confidence");
  });

  runner.runTest("Missing values are invalid", [&]() {
    auto result = validator.validateCoordinates(std::nullopt, 10.0);
    runner.assertFalse(result.isValid, "missing latitude");
    runner.assertTrue(result.validationStatus == ValidationStatus::INVALID, "status invalid");
    runner.assertNear(0.0, result.confidence, 1e-9, "no confidence");
  });

  runner.runTest("Null island is suspicious", [&]() {
    auto result = validator.validateCoordinates(0.0, 0.0);
    runner.assertFalse(result.isValid, "0,0 not valid");
    runner.assertTrue(result.validationStatus == ValidationStatus::SUSPICIOUS_ZERO,
                      "status suspicious_zero");
    runner.assertNear(0.1, result.confidence, 1e-9, "low confidence");
  });

  runner.runTest("Swapped coordinates are fixed", [&]() {
    auto fixed = validator.validateCoordinates(139.6503, 35.6762);
    runner.assertTrue(fixed.isValid, "fixed pair is valid");
    runner.assertTrue(fixed.wasSwapped, "marked swapped");
    runner.assertTrue(fixed.validationStatus == ValidationStatus::SWAPPED, "status swapped");
    runner.assertNear(35.6762, fixed.latitude, 1e-9, "latitude restored");
    runner.assertNear(139.6503, fixed.longitude, 1e-9, "longitude restored");
    runner.assertNear(0.8, fixed.confidence, 1e-9, "reduced confidence");

    auto unfixed = validator.validateCoordinates(139.6503, 35.6762, false);
    runner.assertFalse(unfixed.isValid, "without autofix the pair stays invalid");
    runner.assertNear(0.3, unfixed.confidence, 1e-9, "autofix off confidence");
  });

  runner.runTest("Out of range", [&]() {
    auto result = validator.validateCoordinates(95.0, 200.0);
    runner.assertFalse(result.isValid, "out of range");
    runner.assertTrue(result.validationStatus == ValidationStatus::OUT_OF_RANGE,
                      "status out_of_range");
  });

  runner.runTest("Extract from combined values", [&]() {
    auto comma = validator.extractFromCombined(FieldValue::string("40.7128, -74.0060"),
                                               CombinedFormat::AUTO);
    runner.assertTrue(comma.isValid, "comma pair valid");
    runner.assertEquals(std::string("combined_comma"), comma.format, "comma format");
    runner.assertNear(40.7128, *comma.latitude, 1e-9, "comma latitude");

    auto geojson = validator.extractFromCombined(
        FieldValue::string(R"({"type":"Point","coordinates":[13.405,52.52]})"),
        CombinedFormat::AUTO);
    runner.assertTrue(geojson.isValid, "geojson valid");
    runner.assertEquals(std::string("geojson"), geojson.format, "geojson format");
    runner.assertNear(52.52, *geojson.latitude, 1e-9, "geojson latitude comes second");
    runner.assertNear(13.405, *geojson.longitude, 1e-9, "geojson longitude comes first");

    auto brackets = validator.extractFromCombined(FieldValue::string("[48.8566, 2.3522]"),
                                                  CombinedFormat::BRACKETS);
    runner.assertTrue(brackets.isValid, "bracket pair valid");

    auto garbage = validator.extractFromCombined(FieldValue::string("somewhere"),
                                                 CombinedFormat::AUTO);
    runner.assertFalse(garbage.isValid, "text is not a coordinate");
    runner.assertEquals(std::string("unknown"), garbage.format, "unknown format");
  });

  runner.runTest("Swapped sample detection", [&]() {
    std::vector<std::pair<std::optional<double>, std::optional<double>>> swapped = {
        {139.65, 35.67}, {-122.41, 37.77}, {33.86, 151.2}, {48.85, 2.35}};
    runner.assertFalse(validator.detectSwappedCoordinates(swapped),
                       "half swapped is below the threshold");
    swapped[2] = {151.2, -33.86};
    swapped[3] = {-73.99, 40.73};
    runner.assertTrue(validator.detectSwappedCoordinates(swapped), "all swapped");

    std::vector<std::pair<std::optional<double>, std::optional<double>>> normal = {
        {35.67, 139.65}, {37.77, -122.41}};
    runner.assertFalse(validator.detectSwappedCoordinates(normal), "normal order");
  });

  runner.runTest("Confidence penalties", [&]() {
    runner.assertNear(1.0, validator.calculateConfidence(51.5074, -0.1278), 1e-9,
                      "ordinary coordinate");
    runner.assertNear(0.9, validator.calculateConfidence(51.0, 7.0), 1e-9,
                      "integer pair");
    runner.assertNear(0.5, validator.calculateConfidence(40.7128, -74.006), 1e-9,
                      "well-known test coordinate");
    runner.assertTrue(validator.calculateConfidence(89.95, 10.5) < 1.0,
                      "near the pole");
  });

  runner.printSummary();
  return 0;
}
