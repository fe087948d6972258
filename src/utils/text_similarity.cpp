#include "utils/text_similarity.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <vector>

namespace TextSimilarity {

int levenshteinDistance(const std::string &s1, const std::string &s2) {
  size_t m = s1.length();
  size_t n = s2.length();

  if (m == 0)
    return static_cast<int>(n);
  if (n == 0)
    return static_cast<int>(m);

  // Two rolling rows instead of the full (m+1)x(n+1) table.
  std::vector<int> prev(n + 1);
  std::vector<int> curr(n + 1);
  for (size_t j = 0; j <= n; ++j) {
    prev[j] = static_cast<int>(j);
  }

  for (size_t i = 1; i <= m; ++i) {
    curr[0] = static_cast<int>(i);
    for (size_t j = 1; j <= n; ++j) {
      int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
      curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }

  return prev[n];
}

double calculateSimilarity(const std::string &s1, const std::string &s2) {
  size_t maxLen = std::max(s1.length(), s2.length());
  if (maxLen == 0) {
    return 1.0;
  }
  int distance = levenshteinDistance(s1, s2);
  return 1.0 - (static_cast<double>(distance) / static_cast<double>(maxLen));
}

std::string normalizeFieldName(const std::string &name) {
  return StringUtils::toLower(StringUtils::removeChars(name, "_-"));
}

double fieldNameSimilarity(const std::string &a, const std::string &b) {
  return calculateSimilarity(normalizeFieldName(a), normalizeFieldName(b));
}

double jaccardIndex(const std::set<std::string> &a,
                    const std::set<std::string> &b) {
  if (a.empty() && b.empty()) {
    return 1.0;
  }
  size_t intersection = 0;
  for (const auto &item : a) {
    if (b.count(item) > 0) {
      ++intersection;
    }
  }
  size_t unionSize = a.size() + b.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

} // namespace TextSimilarity
