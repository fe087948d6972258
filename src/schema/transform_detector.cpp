#include "schema/transform_detector.h"
#include "core/logger.h"
#include "schema/schema_similarity.h"
#include "utils/string_utils.h"
#include "utils/text_similarity.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace {

constexpr double EXACT_NAME_SCORE = 1.0;
constexpr double AFFIX_NAME_SCORE = 0.9;
constexpr double CONTAINS_NAME_SCORE = 0.8;

constexpr double NAME_WEIGHT = 60.0;
constexpr double TYPE_WEIGHT = 25.0;
constexpr double POSITION_WEIGHT = 15.0;

constexpr std::array<const char *, 2> RENAME_PREFIXES = {"start_", "end_"};
constexpr std::array<const char *, 1> RENAME_SUFFIXES = {"_name"};
constexpr std::array<const char *, 1> RENAME_CONTEXT_PREFIXES = {"event_"};

bool isAffixOf(const std::string &shorter, const std::string &longer) {
  for (const char *prefix : RENAME_PREFIXES) {
    if (longer == prefix + shorter) {
      return true;
    }
  }
  for (const char *prefix : RENAME_CONTEXT_PREFIXES) {
    if (longer == prefix + shorter) {
      return true;
    }
  }
  for (const char *suffix : RENAME_SUFFIXES) {
    if (longer == shorter + suffix) {
      return true;
    }
  }
  return false;
}

struct Candidate {
  size_t removedIndex;
  size_t addedIndex;
  int confidence;
  double nameScore;
  bool typeCompatible;
  bool samePosition;
};

std::string describeEvidence(const Candidate &candidate) {
  std::string reason;
  if (candidate.nameScore >= EXACT_NAME_SCORE) {
    reason = "Field names differ only in letter case";
  } else if (candidate.nameScore >= AFFIX_NAME_SCORE) {
    reason = "Field name matches a common rename pattern";
  } else if (candidate.nameScore >= CONTAINS_NAME_SCORE) {
    reason = "One field name contains the other";
  } else {
    reason = "Field names are similar (" +
             std::to_string(static_cast<int>(std::round(candidate.nameScore * 100))) +
             "% match)";
  }
  if (candidate.typeCompatible) {
    reason += ", compatible types";
  }
  if (candidate.samePosition) {
    reason += ", same position in schema";
  }
  return reason;
}

} // namespace

ordered_json TransformSuggestion::toJson() const {
  return ordered_json{{"type", type},
                      {"from", from},
                      {"to", to},
                      {"confidence", confidence},
                      {"reason", reason}};
}

TransformDetector::TransformDetector(size_t minConfidence)
    : minConfidence_(minConfidence) {
  if (minConfidence_ > EngineConfig::MAX_SCORE) {
    throw std::invalid_argument("Rename confidence threshold must be at most 100");
  }
}

double TransformDetector::nameScore(const std::string &oldName,
                                    const std::string &newName) {
  const std::string a = StringUtils::toLower(oldName);
  const std::string b = StringUtils::toLower(newName);
  if (a == b) {
    return EXACT_NAME_SCORE;
  }
  if (isAffixOf(a, b) || isAffixOf(b, a)) {
    return AFFIX_NAME_SCORE;
  }
  if (!a.empty() && !b.empty() &&
      (a.find(b) != std::string::npos || b.find(a) != std::string::npos)) {
    return CONTAINS_NAME_SCORE;
  }
  return TextSimilarity::fieldNameSimilarity(a, b);
}

bool TransformDetector::typesCompatible(const SchemaField *oldField,
                                        const SchemaField *newField) {
  if (oldField == nullptr || newField == nullptr) {
    return true;
  }
  const std::vector<std::string> oldTypes = oldField->nonNullTypes();
  const std::vector<std::string> newTypes = newField->nonNullTypes();
  if (oldTypes.empty() || newTypes.empty()) {
    return true;
  }
  for (const auto &oldType : oldTypes) {
    for (const auto &newType : newTypes) {
      if (SchemaSimilarity::areTypesCompatible(oldType, newType)) {
        return true;
      }
    }
  }
  return false;
}

std::vector<TransformSuggestion>
TransformDetector::detectTransforms(const StructuralSchema &oldSchema,
                                    const StructuralSchema &newSchema,
                                    const std::vector<SchemaChange> &changes) const {
  std::vector<std::string> removed;
  std::vector<std::string> added;
  for (const auto &change : changes) {
    if (change.type == ChangeType::REMOVED_FIELD) {
      removed.push_back(change.path);
    } else if (change.type == ChangeType::NEW_FIELD) {
      added.push_back(change.path);
    }
  }
  if (removed.empty() || added.empty()) {
    return {};
  }

  std::vector<Candidate> candidates;
  for (size_t r = 0; r < removed.size(); ++r) {
    const SchemaField *oldField = oldSchema.find(removed[r]);
    const int oldIndex = oldSchema.indexOf(removed[r]);

    for (size_t a = 0; a < added.size(); ++a) {
      const SchemaField *newField = newSchema.find(added[a]);
      const int newIndex = newSchema.indexOf(added[a]);

      Candidate candidate;
      candidate.removedIndex = r;
      candidate.addedIndex = a;
      candidate.nameScore = nameScore(removed[r], added[a]);
      candidate.typeCompatible = typesCompatible(oldField, newField);
      candidate.samePosition = oldIndex >= 0 && oldIndex == newIndex;

      double score = NAME_WEIGHT * candidate.nameScore +
                     (candidate.typeCompatible ? TYPE_WEIGHT : 0.0) +
                     (candidate.samePosition ? POSITION_WEIGHT : 0.0);
      candidate.confidence =
          std::min(static_cast<int>(std::round(score)),
                   static_cast<int>(EngineConfig::MAX_SCORE));

      if (candidate.nameScore >= MIN_RENAME_NAME_SCORE &&
          candidate.confidence >= static_cast<int>(minConfidence_)) {
        candidates.push_back(candidate);
      }
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate &x, const Candidate &y) {
                     return x.confidence > y.confidence;
                   });

  std::vector<bool> removedClaimed(removed.size(), false);
  std::vector<bool> addedClaimed(added.size(), false);
  std::vector<TransformSuggestion> suggestions;

  for (const auto &candidate : candidates) {
    if (removedClaimed[candidate.removedIndex] ||
        addedClaimed[candidate.addedIndex]) {
      continue;
    }
    removedClaimed[candidate.removedIndex] = true;
    addedClaimed[candidate.addedIndex] = true;

    TransformSuggestion suggestion;
    suggestion.from = added[candidate.addedIndex];
    suggestion.to = removed[candidate.removedIndex];
    suggestion.confidence = candidate.confidence;
    suggestion.reason = describeEvidence(candidate);
    suggestions.push_back(std::move(suggestion));
  }

  if (!suggestions.empty()) {
    Logger::info(LogCategory::SCHEMA, "TransformDetector::detectTransforms",
                 "Suggested " + std::to_string(suggestions.size()) +
                     " field rename(s)");
  }
  return suggestions;
}
