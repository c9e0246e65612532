#include <sage/console_reporter.h>
#include <sage/errors.h>
#include <sage/json_reporter.h>
#include <sage/reporter_registry.h>
#include <sage/result_assembler.h>
#include <sage/sarif_reporter.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <yaml-cpp/yaml.h>

#include "test_support/temporary_project.h"
#include "test_support/test_doubles.h"

namespace sage {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

ProjectResult SampleResult() {
  FileRecord app;
  app.file_path = "src/app.py";
  app.language = "python";
  auto password = test::MakeTestIssue("src/app.py", "hardcoded", 3,
                                      Severity::kCritical, Category::kSecurity);
  password.rule_id = "hardcoded-password";
  password.location.column_start = 5;
  password.location.column_end = 20;
  password.code_snippet = "password = \"hunter2\"";
  password.references = {"CWE-798"};
  app.issues.push_back(password);
  auto smell = test::MakeTestIssue("src/app.py", "long_func", 10,
                                   Severity::kLow, Category::kCodeSmell);
  smell.auto_fixable = true;
  app.issues.push_back(smell);
  app.metrics = CodeMetrics{12, 10, 1, 1, 1, 2.0, 2};

  FileRecord broken;
  broken.file_path = "src/broken.js";
  broken.language = "javascript";
  broken.success = false;
  broken.error = "Cannot read file";

  return AssembleResult("/work/project", {app, broken}, 0.25,
                        IssueAggregator());
}

TEST(JsonReporterTest, WritesParsableReport) {
  const auto json = JsonReporter().Render(SampleResult());
  const auto root = YAML::Load(json);

  EXPECT_EQ(root["project_path"].as<std::string>(), "/work/project");
  EXPECT_EQ(root["total_files"].as<int>(), 2);
  EXPECT_EQ(root["total_issues"].as<int>(), 2);
  EXPECT_EQ(root["languages"]["python"].as<int>(), 1);
  EXPECT_EQ(root["summary"]["by_severity"]["critical"].as<int>(), 1);
  EXPECT_EQ(root["summary"]["auto_fixable"].as<int>(), 1);

  const auto files = root["files"];
  ASSERT_EQ(files.size(), 2U);
  const auto issue = files[0]["issues"][0];
  EXPECT_EQ(issue["severity"].as<std::string>(), "critical");
  EXPECT_EQ(issue["category"].as<std::string>(), "security");
  EXPECT_EQ(issue["rule_id"].as<std::string>(), "hardcoded-password");
  EXPECT_EQ(issue["location"]["column_start"].as<int>(), 5);
  EXPECT_TRUE(issue["ai_explanation"].IsNull());
  EXPECT_EQ(issue["references"][0].as<std::string>(), "CWE-798");
  EXPECT_EQ(issue["metadata"]["check"].as<std::string>(), "hardcoded");

  EXPECT_FALSE(files[1]["success"].as<bool>());
  EXPECT_EQ(files[1]["error"].as<std::string>(), "Cannot read file");
  EXPECT_TRUE(files[1]["metrics"].IsNull());
}

TEST(JsonReporterTest, ReportReadsBack) {
  const auto original = SampleResult();
  const auto parsed = ParseJsonReport(JsonReporter().Render(original));

  EXPECT_EQ(parsed.project_path, original.project_path);
  EXPECT_EQ(parsed.timestamp, original.timestamp);
  EXPECT_EQ(parsed.total_files, 2U);
  EXPECT_EQ(parsed.total_issues, 2U);
  ASSERT_EQ(parsed.files.size(), 2U);

  const auto &issue = parsed.files[0].issues[0];
  const auto &expected = original.files[0].issues[0];
  EXPECT_EQ(issue.id, expected.id);
  EXPECT_EQ(issue.severity, Severity::kCritical);
  EXPECT_EQ(issue.location.column_end, 20);
  EXPECT_EQ(issue.code_snippet, expected.code_snippet);
  EXPECT_THAT(issue.references, ElementsAre("CWE-798"));
  EXPECT_EQ(issue.metadata, expected.metadata);
  ASSERT_TRUE(parsed.files[0].metrics.has_value());
  EXPECT_EQ(parsed.files[0].metrics->lines_of_code, 12);

  EXPECT_FALSE(parsed.files[1].success);
  EXPECT_EQ(parsed.summary.high_priority, original.summary.high_priority);
}

TEST(JsonReporterTest, RejectsNonReports) {
  EXPECT_THROW(ParseJsonReport("[1, 2, 3]"), SageError);
  EXPECT_THROW(ParseJsonReport("{\"files\": [{\"language\": \"python\"}]}"),
               SageError);
  EXPECT_THROW(ParseJsonReport("{\"files\": [}"), SageError);
}

TEST(JsonReporterTest, LoadsReportFromDisk) {
  test::TemporaryProject project;
  const auto path =
      project.AddFile("report.json", JsonReporter().Render(SampleResult()));

  EXPECT_EQ(LoadJsonReport(path).total_issues, 2U);
  EXPECT_THROW(LoadJsonReport(project.root() / "missing.json"),
               FileAccessError);
}

TEST(SarifReporterTest, MapsIssuesToResults) {
  const auto sarif = SarifReporter().Render(SampleResult());
  const auto root = YAML::Load(sarif);

  EXPECT_EQ(root["version"].as<std::string>(), "2.1.0");
  EXPECT_THAT(root["$schema"].as<std::string>(), HasSubstr("sarif-2.1.0"));
  const auto run = root["runs"][0];
  EXPECT_EQ(run["tool"]["driver"]["name"].as<std::string>(), "code-sage");
  EXPECT_EQ(run["tool"]["driver"]["rules"].size(), 2U);

  const auto results = run["results"];
  ASSERT_EQ(results.size(), 2U);
  EXPECT_EQ(results[0]["ruleId"].as<std::string>(), "hardcoded-password");
  EXPECT_EQ(results[0]["level"].as<std::string>(), "error");
  const auto region = results[0]["locations"][0]["physicalLocation"]["region"];
  EXPECT_EQ(region["startLine"].as<int>(), 3);
  EXPECT_EQ(region["startColumn"].as<int>(), 5);
  EXPECT_EQ(region["endColumn"].as<int>(), 21);
  EXPECT_EQ(results[1]["ruleId"].as<std::string>(), "long_func");
  EXPECT_EQ(results[1]["level"].as<std::string>(), "note");
}

TEST(SarifReporterTest, LevelsFollowSeverity) {
  EXPECT_EQ(SarifLevel(Severity::kCritical), "error");
  EXPECT_EQ(SarifLevel(Severity::kHigh), "error");
  EXPECT_EQ(SarifLevel(Severity::kMedium), "warning");
  EXPECT_EQ(SarifLevel(Severity::kLow), "note");
  EXPECT_EQ(SarifLevel(Severity::kInfo), "none");
}

TEST(ConsoleReporterTest, ListsIssuesAndFailures) {
  const auto text = ConsoleReporter().Render(SampleResult());

  EXPECT_THAT(text, HasSubstr("Code Sage analysis of /work/project"));
  EXPECT_THAT(text, HasSubstr("src/app.py (python, 2 issues)"));
  EXPECT_THAT(text, HasSubstr("[CRITICAL] hardcoded"));
  EXPECT_THAT(text, HasSubstr("at src/app.py:3:5"));
  EXPECT_THAT(text, HasSubstr("password = \"hunter2\""));
  EXPECT_THAT(text, HasSubstr("(code_smell, auto-fixable)"));
  EXPECT_THAT(text,
              HasSubstr("src/broken.js (javascript): FAILED - Cannot read file"));
  EXPECT_THAT(text, Not(HasSubstr("No issues found.")));
}

TEST(ConsoleReporterTest, SnippetsCanBeHidden) {
  const auto text = ConsoleReporter(false).Render(SampleResult());
  EXPECT_THAT(text, Not(HasSubstr("hunter2")));
}

TEST(ConsoleReporterTest, ReportsCleanProject) {
  FileRecord clean;
  clean.file_path = "ok.py";
  clean.language = "python";
  const auto result = AssembleResult("/work", {clean}, 0.0, IssueAggregator());

  EXPECT_THAT(ConsoleReporter().Render(result), HasSubstr("No issues found."));
}

TEST(ReporterRegistryTest, DefaultsAndLookup) {
  const auto registry = MakeReporterRegistryWithDefaults();

  EXPECT_EQ(registry.DefaultName(), "console");
  EXPECT_THAT(registry.Names(), ElementsAre("console", "json", "sarif"));
  EXPECT_NE(dynamic_cast<ConsoleReporter *>(registry.Create().get()), nullptr);
  EXPECT_NE(dynamic_cast<SarifReporter *>(registry.Create("sarif").get()),
            nullptr);
  EXPECT_TRUE(registry.Contains("json"));
  EXPECT_FALSE(registry.Contains("html"));
}

TEST(ReporterRegistryTest, UnknownNameListsRegisteredOnes) {
  const auto registry = MakeReporterRegistryWithDefaults();
  try {
    registry.Create("html");
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown reporter 'html'"));
    EXPECT_THAT(error.what(), HasSubstr("console, json, sarif"));
  }
}

TEST(ReporterRegistryTest, RejectsDuplicatesAndEmptyNames) {
  ReporterRegistry registry;
  const auto factory = []() { return std::make_unique<JsonReporter>(); };
  registry.Register("json", factory);

  EXPECT_THROW(registry.Register("json", factory), std::invalid_argument);
  EXPECT_THROW(registry.Register("", factory), std::invalid_argument);
  EXPECT_EQ(registry.DefaultName(), "json");
}

} // namespace
} // namespace sage
