#include <sage/cli_exit_codes.h>
#include <sage/result_assembler.h>

#include <gtest/gtest.h>

#include "test_support/test_doubles.h"

namespace sage {
namespace {

ProjectResult ResultWith(std::vector<Issue> issues) {
  FileRecord record;
  record.file_path = "a.py";
  record.language = "python";
  record.issues = std::move(issues);
  return AssembleResult("p", {record}, 0.0, IssueAggregator());
}

TEST(AnalysisExitCodeTest, ReturnsZeroWhenResultIsClean) {
  EXPECT_EQ(kExitClean, AnalysisExitCode(ProjectResult{}));
  EXPECT_EQ(kExitClean, AnalysisExitCode(ResultWith({})));
}

TEST(AnalysisExitCodeTest, NonCriticalIssuesStillExitClean) {
  const auto result = ResultWith({test::MakeTestIssue(
      "a.py", "high", 1, Severity::kHigh, Category::kSecurity)});

  EXPECT_EQ(kExitClean, AnalysisExitCode(result));
}

TEST(AnalysisExitCodeTest, CriticalIssueSelectsCriticalExitCode) {
  const auto result = ResultWith(
      {test::MakeTestIssue("a.py", "low", 1, Severity::kLow, Category::kStyle),
       test::MakeTestIssue("a.py", "crit", 2, Severity::kCritical,
                           Category::kBug)});

  EXPECT_EQ(kExitCritical, AnalysisExitCode(result));
  EXPECT_NE(kExitError, kExitCritical);
}

TEST(AnalysisExitCodeTest, FilteringOutCriticalIssuesClearsTheCode) {
  auto result = ResultWith({test::MakeTestIssue(
      "a.py", "crit", 2, Severity::kCritical, Category::kBug)});
  IssueFilter filter;
  filter.categories = {Category::kSecurity};

  EXPECT_EQ(kExitClean,
            AnalysisExitCode(FilterResult(result, filter, IssueAggregator())));
}

} // namespace
} // namespace sage
