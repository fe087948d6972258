#include "mapping/field_patterns.h"
#include "mapping/language_support.h"
#include "../test_runner.h"

namespace {

class FixedDetector : public LanguageDetector {
public:
  FixedDetector(std::string code, double confidence)
      : code_(std::move(code)), confidence_(confidence) {}

  LanguageDetection detect(const std::string &) const override {
    return LanguageDetection{code_, confidence_};
  }

private:
  std::string code_;
  double confidence_;
};

const std::string LONG_TEXT = "Das Sommerfest findet im Stadtpark statt";

} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Supported languages and names", [&]() {
    runner.assertTrue(LanguageSupport::isSupportedLanguage("deu"), "German");
    runner.assertTrue(LanguageSupport::isSupportedLanguage("por"), "Portuguese");
    runner.assertFalse(LanguageSupport::isSupportedLanguage("jpn"), "Japanese");
    runner.assertEquals(std::string("German"), LanguageSupport::languageName("deu"), "name");
    runner.assertEquals(std::string("Unknown"), LanguageSupport::languageName("und"),
                        "undetermined");
    runner.assertEquals(std::string("xyz"), LanguageSupport::languageName("xyz"),
                        "unknown code echoed");
  });

  runner.runTest("Values without language signal", [&]() {
    runner.assertTrue(LanguageSupport::isNonTextValue("user@example.com"), "email");
    runner.assertTrue(LanguageSupport::isNonTextValue("https://example.org"), "url");
    runner.assertTrue(LanguageSupport::isNonTextValue("2024-01-15"), "date");
    runner.assertTrue(LanguageSupport::isNonTextValue("-12.5"), "number");
    runner.assertTrue(LanguageSupport::isNonTextValue("52.52, 13.405"), "coordinate pair");
    runner.assertTrue(
        LanguageSupport::isNonTextValue("123e4567-e89b-12d3-a456-426614174000"), "uuid");
    runner.assertTrue(LanguageSupport::isNonTextValue("030 1234 567"), "digit run");
    runner.assertFalse(LanguageSupport::isNonTextValue("Summer festival"), "prose");
  });

  runner.runTest("Text extraction", [&]() {
    const std::vector<Row> rows = rowsFromJson(ordered_json::parse(R"([
      {"id": 1, "title": "Sommerfest", "email": "a@b.de", "code": "ab"},
      {"id": 2, "title": "Weihnachtsmarkt", "email": "c@d.de", "code": "cd"}
    ])"));
    const std::string text =
        LanguageSupport::extractTextForLanguageDetection(rows, {"id", "title", "email"});
    runner.assertEquals(std::string("title email Sommerfest Weihnachtsmarkt"), text,
                        "headers then prose cells");

    const std::string cut =
        LanguageSupport::extractTextForLanguageDetection(rows, {"title"}, 8);
    runner.assertEquals(std::string("title So"), cut, "cut to the limit");

    const std::vector<Row> accented = rowsFromJson(ordered_json::parse(R"([
      {"t": "Café am See"}
    ])"));
    const std::string utf8 = LanguageSupport::extractTextForLanguageDetection(accented, {}, 4);
    runner.assertEquals(std::string("Caf"), utf8, "never splits a character");
  });

  runner.runTest("Language resolution", [&]() {
    LanguageDetectionResult none = LanguageSupport::resolveLanguage(nullptr, LONG_TEXT);
    runner.assertEquals(std::string("eng"), none.code, "no detector");
    runner.assertFalse(none.isReliable, "default is not reliable");

    FixedDetector german("deu", 0.9);
    LanguageDetectionResult detected = LanguageSupport::resolveLanguage(&german, LONG_TEXT);
    runner.assertEquals(std::string("deu"), detected.code, "detected");
    runner.assertEquals(std::string("German"), detected.name, "named");
    runner.assertTrue(detected.isReliable, "reliable");

    runner.assertEquals(std::string("eng"),
                        LanguageSupport::resolveLanguage(&german, "kurz").code, "short text");

    FixedDetector japanese("jpn", 0.99);
    runner.assertEquals(std::string("eng"),
                        LanguageSupport::resolveLanguage(&japanese, LONG_TEXT).code,
                        "unsupported language");

    FixedDetector unsure("fra", 0.3);
    LanguageDetectionResult low = LanguageSupport::resolveLanguage(&unsure, LONG_TEXT);
    runner.assertEquals(std::string("eng"), low.code, "unsure detector");
    runner.assertNear(0.3, low.confidence, 1e-9, "confidence kept");
    runner.assertFalse(low.isReliable, "not reliable");
  });

  runner.runTest("Column name patterns", [&]() {
    runner.assertEquals(std::string("t\xc3\xadtulo"),
                        FieldPatternTable::foldCase("T\xc3\x8dTULO"), "Latin-1 upper case");
    const FieldPatternTable &table = FieldPatternTable::builtin();
    const auto *spanish = table.patterns(FieldRole::TITLE, "spa");
    runner.assertTrue(spanish != nullptr, "Spanish titles");
    runner.assertEquals(0, FieldPatternTable::matchIndex(*spanish, "T\xc3\x8dTULO"),
                        "case folded match");
    runner.assertEquals(-1, FieldPatternTable::matchIndex(*spanish, "price"), "no match");
    runner.assertFalse(table.hasLanguage(FieldRole::TITLE, "jpn"), "no Japanese table");
    runner.assertEquals(std::string("locationName"),
                        fieldRoleToString(FieldRole::LOCATION_NAME), "role name");
  });

  runner.printSummary();
  return 0;
}
