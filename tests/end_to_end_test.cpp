#include <sage/detector_registry.h>
#include <sage/file_discovery.h>
#include <sage/file_orchestrator.h>
#include <sage/result_assembler.h>
#include <sage/source_reader.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

#include "test_support/temporary_project.h"
#include "test_support/test_doubles.h"

namespace sage {
namespace {

using ::testing::HasSubstr;

ProjectResult
AnalyzeWithDefaults(const std::filesystem::path &root,
                    std::shared_ptr<const FileDiscovery> discovery = nullptr) {
  const AnalysisSettings settings;
  auto reader = std::make_shared<FileSourceReader>();
  if (!discovery) {
    discovery = std::make_shared<GlobFileDiscovery>();
  }
  FileOrchestrator orchestrator(
      settings, MakeDefaultDetectorRegistry(settings, reader),
      MakeRuleCatalog(settings, {}, nullptr), std::move(discovery), reader);
  return orchestrator.AnalyzeProject(root);
}

std::vector<Issue>::const_iterator FindCheck(const std::vector<Issue> &issues,
                                             const std::string &check) {
  return std::find_if(issues.begin(), issues.end(), [&](const Issue &issue) {
    const auto found = issue.metadata.find("check");
    return found != issue.metadata.end() && found->second == check;
  });
}

TEST(EndToEndTest, SecretOutranksPythonFindings) {
  test::TemporaryProject project;
  project.AddFile("service.py", "import json\n"
                                "\n"
                                "api_password = \"super_secret_123\"\n"
                                "\n"
                                "def load(path, expected):\n"
                                "    try:\n"
                                "        data = json.load(open(path))\n"
                                "    except:\n"
                                "        data = None\n"
                                "    if expected is 5:\n"
                                "        return data\n"
                                "    return None\n");

  const auto result = AnalyzeWithDefaults(project.root());

  ASSERT_EQ(result.files.size(), 1U);
  const auto &issues = result.files[0].issues;
  ASSERT_GE(issues.size(), 3U);

  EXPECT_EQ(issues[0].severity, Severity::kCritical);
  EXPECT_EQ(issues[0].category, Category::kSecurity);
  EXPECT_EQ(issues[0].rule_id, "hardcoded-password");
  EXPECT_EQ(issues[0].location.line_start, 3);

  const auto bare_except = FindCheck(issues, "bare_except");
  ASSERT_NE(bare_except, issues.end());
  EXPECT_EQ(bare_except->severity, Severity::kMedium);
  EXPECT_TRUE(bare_except->auto_fixable);
  EXPECT_EQ(bare_except->location.line_start, 8);

  const auto identity = FindCheck(issues, "is_literal");
  ASSERT_NE(identity, issues.end());
  EXPECT_EQ(identity->severity, Severity::kMedium);
  EXPECT_EQ(identity->category, Category::kBug);
  EXPECT_TRUE(identity->auto_fixable);
  EXPECT_EQ(identity->location.line_start, 10);
}

TEST(EndToEndTest, TooManyParametersIsOneFinding) {
  test::TemporaryProject project;
  project.AddFile("wide.py", "def wide(a, b, c, d, e, f, g):\n"
                             "    return a\n");

  const auto result = AnalyzeWithDefaults(project.root());

  ASSERT_EQ(result.files.size(), 1U);
  const auto &issues = result.files[0].issues;
  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].category, Category::kCodeSmell);
  EXPECT_THAT(issues[0].title, HasSubstr("Too Many Parameters"));
}

TEST(EndToEndTest, IdsAreStableAcrossRuns) {
  test::TemporaryProject project;
  project.AddFile("a.py", "password = \"hunter2\"\ntry:\n    x()\nexcept:\n"
                          "    pass\n");
  project.AddFile("b.js", "var x = 1;\nif (x == 2) { eval(x); }\n");

  const auto first = AllIssues(AnalyzeWithDefaults(project.root()));
  const auto second = AllIssues(AnalyzeWithDefaults(project.root()));

  ASSERT_EQ(first.size(), second.size());
  ASSERT_FALSE(first.empty());
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].id, second[i].id);
  }
}

TEST(EndToEndTest, SyntaxErrorIsACriticalFindingNotAFailure) {
  test::TemporaryProject project;
  project.AddFile("broken.py", "def broken(:\n    pass\n");

  const auto result = AnalyzeWithDefaults(project.root());

  ASSERT_EQ(result.files.size(), 1U);
  EXPECT_TRUE(result.files[0].success);
  ASSERT_EQ(result.files[0].issues.size(), 1U);
  EXPECT_EQ(result.files[0].issues[0].severity, Severity::kCritical);
  EXPECT_EQ(result.files[0].issues[0].title, "Python Syntax Error");
}

TEST(EndToEndTest, UnreadableFileIsAFailedRecordWithoutIssues) {
  test::TemporaryProject project;
  const auto readable = project.AddFile("ok.py", "password = \"hunter2\"\n");
  const auto unreadable = project.root() / "pkg.py";
  std::filesystem::create_directories(unreadable);

  const auto result = AnalyzeWithDefaults(
      project.root(), std::make_shared<test::FixedDiscovery>(
                          std::vector<std::filesystem::path>{readable,
                                                             unreadable}));

  ASSERT_EQ(result.files.size(), 2U);
  const auto failed = std::count_if(
      result.files.begin(), result.files.end(),
      [](const FileRecord &file) { return !file.success; });
  ASSERT_EQ(failed, 1);
  for (const auto &file : result.files) {
    if (file.success) {
      EXPECT_FALSE(file.issues.empty());
    } else {
      EXPECT_EQ(file.file_path, unreadable.string());
      EXPECT_TRUE(file.issues.empty());
      EXPECT_TRUE(file.error.has_value());
    }
  }
}

} // namespace
} // namespace sage
