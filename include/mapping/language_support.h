#ifndef LANGUAGE_SUPPORT_H
#define LANGUAGE_SUPPORT_H

#include "core/field_value.h"
#include <array>
#include <string>
#include <vector>

struct LanguageDetection {
  std::string code;
  double confidence = 0.0;
};

// Statistical language identification lives outside the engine; callers
// plug an implementation in through this interface.
class LanguageDetector {
public:
  virtual ~LanguageDetector() = default;
  virtual LanguageDetection detect(const std::string &text) const = 0;
};

struct LanguageDetectionResult {
  std::string code;
  std::string name;
  double confidence = 0.0;
  bool isReliable = false;

  ordered_json toJson() const;
};

namespace LanguageSupport {

constexpr std::array<const char *, 7> SUPPORTED_LANGUAGES = {
    "eng", "deu", "fra", "spa", "ita", "nld", "por"};
constexpr const char *DEFAULT_LANGUAGE = "eng";
constexpr const char *UNDETERMINED = "und";
constexpr size_t MIN_TEXT_LENGTH = 20;
constexpr double RELIABILITY_THRESHOLD = 0.5;
constexpr size_t DEFAULT_MAX_TEXT_CHARS = 5000;

bool isSupportedLanguage(const std::string &code);

// English name of a supported code, "Unknown" for und, the code otherwise.
std::string languageName(const std::string &code);

// Emails, URLs, dates, numbers, coordinate pairs, UUIDs and digit runs
// carry no language signal.
bool isNonTextValue(const std::string &value);

// Headers and prose-looking string cells joined by spaces and cut to
// maxChars bytes on a character boundary.
std::string extractTextForLanguageDetection(
    const std::vector<Row> &rows, const std::vector<std::string> &headers,
    size_t maxChars = DEFAULT_MAX_TEXT_CHARS);

// Runs the detector and falls back to English when the text is too short,
// the detector is missing or unsure, or it names an unsupported language.
LanguageDetectionResult resolveLanguage(const LanguageDetector *detector,
                                        const std::string &text);

} // namespace LanguageSupport

#endif
