#include <sage/taxonomy.h>

#include <gtest/gtest.h>

#include <stdexcept>

namespace sage {
namespace {

TEST(TaxonomyTest, SeverityOrderIsTotal) {
  const auto &severities = AllSeverities();
  ASSERT_EQ(5u, severities.size());
  for (std::size_t i = 1; i < severities.size(); ++i) {
    EXPECT_LT(SeverityRank(severities[i - 1]), SeverityRank(severities[i]));
  }
  EXPECT_EQ(Severity::kInfo, severities.front());
  EXPECT_EQ(Severity::kCritical, severities.back());
}

TEST(TaxonomyTest, IsAtLeastIsInclusive) {
  EXPECT_TRUE(IsAtLeast(Severity::kMedium, Severity::kMedium));
  EXPECT_TRUE(IsAtLeast(Severity::kCritical, Severity::kLow));
  EXPECT_FALSE(IsAtLeast(Severity::kInfo, Severity::kLow));
}

TEST(TaxonomyTest, HighPriorityMeansHighOrCritical) {
  EXPECT_TRUE(IsHighPriority(Severity::kCritical));
  EXPECT_TRUE(IsHighPriority(Severity::kHigh));
  EXPECT_FALSE(IsHighPriority(Severity::kMedium));
}

TEST(TaxonomyTest, WeightsMatchRankingTable) {
  EXPECT_EQ(100, SeverityWeight(Severity::kCritical));
  EXPECT_EQ(75, SeverityWeight(Severity::kHigh));
  EXPECT_EQ(50, SeverityWeight(Severity::kMedium));
  EXPECT_EQ(25, SeverityWeight(Severity::kLow));
  EXPECT_EQ(10, SeverityWeight(Severity::kInfo));

  EXPECT_EQ(20, CategoryWeight(Category::kSecurity));
  EXPECT_EQ(15, CategoryWeight(Category::kBug));
  EXPECT_EQ(10, CategoryWeight(Category::kTypeError));
  EXPECT_EQ(8, CategoryWeight(Category::kPerformance));
  EXPECT_EQ(5, CategoryWeight(Category::kBestPractice));
  EXPECT_EQ(4, CategoryWeight(Category::kComplexity));
  EXPECT_EQ(3, CategoryWeight(Category::kCodeSmell));
  EXPECT_EQ(3, CategoryWeight(Category::kMaintainability));
  EXPECT_EQ(2, CategoryWeight(Category::kDuplication));
  EXPECT_EQ(1, CategoryWeight(Category::kStyle));
}

TEST(TaxonomyTest, ParsesNamesLeniently) {
  EXPECT_EQ(Severity::kHigh, ParseSeverity("HIGH"));
  EXPECT_EQ(Severity::kLow, ParseSeverity(" low "));
  EXPECT_EQ(Category::kCodeSmell, ParseCategory("code-smell"));
  EXPECT_EQ(Category::kBestPractice, ParseCategory("BEST_PRACTICE"));
  EXPECT_EQ("best_practice", CategoryName(Category::kBestPractice));
  EXPECT_EQ("critical", SeverityName(Severity::kCritical));
}

TEST(TaxonomyTest, RejectsUnknownNames) {
  EXPECT_THROW(ParseSeverity("urgent"), std::invalid_argument);
  EXPECT_THROW(ParseCategory("cosmetic"), std::invalid_argument);
}

TEST(TaxonomyTest, EveryCategoryRoundTripsThroughItsName) {
  for (const auto category : AllCategories()) {
    EXPECT_EQ(category, ParseCategory(CategoryName(category)));
  }
}

} // namespace
} // namespace sage
