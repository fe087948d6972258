#include "mapping/language_support.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <regex>

namespace {

const std::vector<std::regex> &nonTextPatterns() {
  static const std::vector<std::regex> patterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    return std::vector<std::regex>{
        std::regex(R"(^[^\s@]+@[^\s@]+\.[a-z]{2,}$)", flags),
        std::regex(R"(^https?://)", flags),
        std::regex(R"(^\d{4}-\d{2}-\d{2}(T\d{2}:\d{2}:\d{2})?)", flags),
        std::regex(R"(^-?\d+(\.\d+)?$)", flags),
        std::regex(R"(^-?\d+\.\d+,\s?-?\d+\.\d+$)", flags),
        std::regex(R"(^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$)",
                   flags),
        std::regex(R"(^[\d\s./-]+$)", flags),
    };
  }();
  return patterns;
}

LanguageDetectionResult englishDefault() {
  return LanguageDetectionResult{LanguageSupport::DEFAULT_LANGUAGE, "English", 0.0,
                                 false};
}

void appendPart(std::string &text, const std::string &part, size_t maxChars) {
  if (text.size() >= maxChars) {
    return;
  }
  if (!text.empty()) {
    text.push_back(' ');
  }
  text += part;
  if (text.size() > maxChars) {
    size_t cut = maxChars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    text.resize(cut);
  }
}

} // namespace

ordered_json LanguageDetectionResult::toJson() const {
  return ordered_json{{"code", code},
                      {"name", name},
                      {"confidence", confidence},
                      {"isReliable", isReliable}};
}

namespace LanguageSupport {

bool isSupportedLanguage(const std::string &code) {
  return std::any_of(SUPPORTED_LANGUAGES.begin(), SUPPORTED_LANGUAGES.end(),
                     [&](const char *supported) { return code == supported; });
}

std::string languageName(const std::string &code) {
  static const std::vector<std::pair<std::string, std::string>> names = {
      {"eng", "English"}, {"deu", "German"},  {"fra", "French"},
      {"spa", "Spanish"}, {"ita", "Italian"}, {"nld", "Dutch"},
      {"por", "Portuguese"}, {"und", "Unknown"}};
  for (const auto &[known, name] : names) {
    if (known == code) {
      return name;
    }
  }
  return code;
}

bool isNonTextValue(const std::string &value) {
  const auto &patterns = nonTextPatterns();
  return std::any_of(patterns.begin(), patterns.end(), [&](const std::regex &p) {
    return std::regex_search(value, p);
  });
}

std::string extractTextForLanguageDetection(const std::vector<Row> &rows,
                                            const std::vector<std::string> &headers,
                                            size_t maxChars) {
  std::string text;

  for (const auto &header : headers) {
    if (StringUtils::utf8Length(header) > 2 && !isNonTextValue(header)) {
      appendPart(text, header, maxChars);
    }
  }

  for (const auto &row : rows) {
    for (const auto &[column, value] : row) {
      if (!value.isString()) {
        continue;
      }
      const std::string trimmed = StringUtils::trim(value.asString());
      if (StringUtils::utf8Length(trimmed) >= 3 && !isNonTextValue(trimmed)) {
        appendPart(text, trimmed, maxChars);
      }
      if (text.size() >= maxChars) {
        return text;
      }
    }
  }
  return text;
}

LanguageDetectionResult resolveLanguage(const LanguageDetector *detector,
                                        const std::string &text) {
  if (detector == nullptr || StringUtils::utf8Length(text) < MIN_TEXT_LENGTH) {
    return englishDefault();
  }

  LanguageDetection detection = detector->detect(text);
  if (detection.code == UNDETERMINED || !isSupportedLanguage(detection.code)) {
    Logger::debug(LogCategory::MAPPING, "LanguageSupport::resolveLanguage",
                  "Detector returned unsupported language '" + detection.code +
                      "', using English");
    return englishDefault();
  }

  if (detection.confidence < RELIABILITY_THRESHOLD) {
    LanguageDetectionResult result = englishDefault();
    result.confidence = detection.confidence;
    return result;
  }

  return LanguageDetectionResult{detection.code, languageName(detection.code),
                                 detection.confidence, true};
}

} // namespace LanguageSupport
