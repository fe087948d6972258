#ifndef TEXT_SIMILARITY_H
#define TEXT_SIMILARITY_H

#include <set>
#include <string>

namespace TextSimilarity {

int levenshteinDistance(const std::string &s1, const std::string &s2);

// 1 - distance / max(len1, len2); two empty strings are identical (1.0).
double calculateSimilarity(const std::string &s1, const std::string &s2);

// Lower-cases and drops '_' and '-' so "start_date", "Start-Date" and
// "startdate" compare equal.
std::string normalizeFieldName(const std::string &name);

// Similarity of the normalized forms of two field names.
double fieldNameSimilarity(const std::string &a, const std::string &b);

// |A ∩ B| / |A ∪ B|; two empty sets score 1.
double jaccardIndex(const std::set<std::string> &a,
                    const std::set<std::string> &b);

} // namespace TextSimilarity

#endif
