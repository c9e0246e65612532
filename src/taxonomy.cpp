#include <sage/taxonomy.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sage {
namespace {

struct SeverityTraits {
  Severity severity;
  int rank;
  int weight;
  const char *name;
};

struct CategoryTraits {
  Category category;
  int weight;
  const char *name;
};

constexpr SeverityTraits kSeverities[] = {
    {Severity::kInfo, 0, 10, "info"},
    {Severity::kLow, 1, 25, "low"},
    {Severity::kMedium, 2, 50, "medium"},
    {Severity::kHigh, 3, 75, "high"},
    {Severity::kCritical, 4, 100, "critical"},
};

constexpr CategoryTraits kCategories[] = {
    {Category::kSecurity, 20, "security"},
    {Category::kBug, 15, "bug"},
    {Category::kCodeSmell, 3, "code_smell"},
    {Category::kTypeError, 10, "type_error"},
    {Category::kStyle, 1, "style"},
    {Category::kPerformance, 8, "performance"},
    {Category::kBestPractice, 5, "best_practice"},
    {Category::kDuplication, 2, "duplication"},
    {Category::kComplexity, 4, "complexity"},
    {Category::kMaintainability, 3, "maintainability"},
};

const SeverityTraits &TraitsOf(Severity severity) {
  for (const auto &traits : kSeverities) {
    if (traits.severity == severity) {
      return traits;
    }
  }
  throw std::logic_error("Unhandled severity value");
}

const CategoryTraits &TraitsOf(Category category) {
  for (const auto &traits : kCategories) {
    if (traits.category == category) {
      return traits;
    }
  }
  throw std::logic_error("Unhandled category value");
}

std::string Normalize(std::string value) {
  value.erase(std::remove_if(value.begin(), value.end(),
                             [](unsigned char ch) { return std::isspace(ch); }),
              value.end());
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

} // namespace

int SeverityRank(Severity severity) { return TraitsOf(severity).rank; }

bool IsAtLeast(Severity severity, Severity minimum) {
  return SeverityRank(severity) >= SeverityRank(minimum);
}

bool IsHighPriority(Severity severity) {
  return IsAtLeast(severity, Severity::kHigh);
}

int SeverityWeight(Severity severity) { return TraitsOf(severity).weight; }

int CategoryWeight(Category category) { return TraitsOf(category).weight; }

std::string SeverityName(Severity severity) { return TraitsOf(severity).name; }

std::string CategoryName(Category category) { return TraitsOf(category).name; }

Severity ParseSeverity(const std::string &name) {
  const auto normalized = Normalize(name);
  for (const auto &traits : kSeverities) {
    if (normalized == traits.name) {
      return traits.severity;
    }
  }
  throw std::invalid_argument("Unknown severity: " + name);
}

Category ParseCategory(const std::string &name) {
  const auto normalized = Normalize(name);
  for (const auto &traits : kCategories) {
    if (normalized == traits.name) {
      return traits.category;
    }
  }
  throw std::invalid_argument("Unknown category: " + name);
}

const std::vector<Severity> &AllSeverities() {
  static const std::vector<Severity> severities = {
      Severity::kInfo, Severity::kLow, Severity::kMedium, Severity::kHigh,
      Severity::kCritical};
  return severities;
}

const std::vector<Category> &AllCategories() {
  static const std::vector<Category> categories = [] {
    std::vector<Category> values;
    for (const auto &traits : kCategories) {
      values.push_back(traits.category);
    }
    return values;
  }();
  return categories;
}

} // namespace sage
