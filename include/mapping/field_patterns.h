#ifndef FIELD_PATTERNS_H
#define FIELD_PATTERNS_H

#include <map>
#include <regex>
#include <string>
#include <vector>

enum class FieldRole { TITLE, DESCRIPTION, LOCATION_NAME, TIMESTAMP, LOCATION };

std::string fieldRoleToString(FieldRole role);

// Column-name patterns per role and ISO-639-3 language code. Patterns are
// anchored, case-insensitive, and ordered from most to least specific. A
// table never changes after construction, so one instance can be shared
// freely.
class FieldPatternTable {
public:
  using PatternSource = std::map<FieldRole, std::map<std::string, std::vector<std::string>>>;

  explicit FieldPatternTable(const PatternSource &source);

  // Patterns for the language, or nullptr when the table has none.
  const std::vector<std::regex> *patterns(FieldRole role,
                                          const std::string &language) const;

  bool hasLanguage(FieldRole role, const std::string &language) const {
    return patterns(role, language) != nullptr;
  }

  // Index of the first pattern matching name, or -1.
  static int matchIndex(const std::vector<std::regex> &patterns,
                        const std::string &name);

  // Lower-cases ASCII and the Latin-1 letters used by the supported
  // languages, so "Título" and "TÍTULO" match the same pattern.
  static std::string foldCase(const std::string &name);

  static const FieldPatternTable &builtin();

private:
  std::map<FieldRole, std::map<std::string, std::vector<std::regex>>> table_;
};

#endif
