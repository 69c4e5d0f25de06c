#include "core/random/ThemeAggregator.h"

#include <algorithm>

namespace {

/// 仅在 other 非空时追加，避免两类为空的常见情况产生多余分配。
void appendIfNotEmpty(std::vector<std::string>& target, const std::vector<std::string>& other) {
  if (!other.empty()) {
    target.insert(target.end(), other.begin(), other.end());
  }
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

std::vector<std::string> aggregateThemes(const Show& show) {
  std::vector<std::string> themes = show.opening_themes;
  appendIfNotEmpty(themes, show.ending_themes);
  appendIfNotEmpty(themes, show.other_soundtrack);
  return themes;
}

ThemeCategory classifyTheme(const std::string& theme, const Show& show) {
  if (contains(show.opening_themes, theme)) {
    return ThemeCategory::Opening;
  }
  if (contains(show.ending_themes, theme)) {
    return ThemeCategory::Ending;
  }
  return ThemeCategory::Other;
}

const char* themeCategoryLabel(ThemeCategory category) {
  switch (category) {
    case ThemeCategory::Opening: return "OP";
    case ThemeCategory::Ending: return "ED";
    case ThemeCategory::Other: return "ST";
  }
  return "ST";
}
