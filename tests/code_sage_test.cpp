#include <sage/cli_exit_codes.h>
#include <sage/code_sage.h>
#include <sage/json_reporter.h>
#include <sage/result_assembler.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "test_support/temporary_project.h"

namespace sage {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ParseAnalyzeArgumentsTest, ReadsEveryOption) {
  const auto options = ParseAnalyzeArguments(
      {"src", "--config", "team.yaml", "--format", "sarif", "--out",
       "out/report.sarif", "--min-severity", "HIGH", "--no-security", "--ai",
       "--rules", "a.yaml,b.yaml", "--rules", "c.yaml", "--workers", "3",
       "--sequential", "--debug"});

  EXPECT_EQ(options.path, std::filesystem::path("src"));
  EXPECT_EQ(options.config_file, std::filesystem::path("team.yaml"));
  EXPECT_EQ(options.format, "sarif");
  EXPECT_EQ(options.output_file, std::filesystem::path("out/report.sarif"));
  EXPECT_EQ(options.min_severity, Severity::kHigh);
  EXPECT_EQ(options.enable_security, false);
  EXPECT_EQ(options.enable_ai, true);
  EXPECT_THAT(options.rule_files,
              ElementsAre(std::filesystem::path("a.yaml"),
                          std::filesystem::path("b.yaml"),
                          std::filesystem::path("c.yaml")));
  EXPECT_EQ(options.workers, 3U);
  EXPECT_EQ(options.parallel, false);
  EXPECT_EQ(options.log_level, LogLevel::kDebug);
  EXPECT_FALSE(options.show_help);
}

TEST(ParseAnalyzeArgumentsTest, LeavesUnsetOptionsEmpty) {
  const auto options = ParseAnalyzeArguments({"."});
  EXPECT_FALSE(options.format.has_value());
  EXPECT_FALSE(options.enable_security.has_value());
  EXPECT_FALSE(options.workers.has_value());
  EXPECT_TRUE(options.rule_files.empty());
}

TEST(ParseAnalyzeArgumentsTest, RejectsBadInput) {
  EXPECT_THROW(ParseAnalyzeArguments({".", "--bogus"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--format", "html"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--format"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--workers", "0"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--workers", "2x"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--workers", "-1"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--workers", " 4"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({".", "--min-severity", "urgent"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"a", "b"}), std::invalid_argument);
}

TEST(ParseAnalyzeArgumentsTest, HelpStopsParsing) {
  const auto options = ParseAnalyzeArguments({"--help", "--bogus"});
  EXPECT_TRUE(options.show_help);
}

TEST(ParseReportArgumentsTest, ReadsInputAndFormat) {
  const auto options = ParseReportArguments(
      {"report.json", "--format", "sarif", "--min-severity", "medium"});
  EXPECT_EQ(options.input, std::filesystem::path("report.json"));
  EXPECT_EQ(options.format, "sarif");
  EXPECT_EQ(options.min_severity, Severity::kMedium);

  EXPECT_THROW(ParseReportArguments({"a.json", "b.json"}),
               std::invalid_argument);
}

TEST(ParseInitArgumentsTest, DefaultsToDotFile) {
  EXPECT_EQ(ParseInitArguments({}).output,
            std::filesystem::path(".codesage.yaml"));
  EXPECT_EQ(ParseInitArguments({"--out", "cfg.yaml"}).output,
            std::filesystem::path("cfg.yaml"));
  EXPECT_THROW(ParseInitArguments({"--force"}), std::invalid_argument);
}

TEST(MergeOptionsTest, CommandLineWinsOverConfig) {
  SageConfig config;
  config.output.format = "json";
  config.analysis.enable_security = true;
  config.custom_rules = {"from-config.yaml"};

  AnalyzeOptions options;
  options.format = "sarif";
  options.enable_security = false;
  options.workers = 8;
  options.rule_files = {"from-cli.yaml"};

  const auto merged = MergeOptions(config, options);

  EXPECT_EQ(merged.output.format, "sarif");
  EXPECT_FALSE(merged.analysis.enable_security);
  EXPECT_EQ(merged.analysis.max_workers, 8U);
  EXPECT_THAT(merged.custom_rules,
              ElementsAre(std::filesystem::path("from-config.yaml"),
                          std::filesystem::path("from-cli.yaml")));
}

TEST(MergeOptionsTest, UnsetOptionsKeepConfig) {
  SageConfig config;
  config.min_severity = Severity::kLow;
  config.analysis.parallel = false;

  const auto merged = MergeOptions(config, AnalyzeOptions{});

  EXPECT_EQ(merged.min_severity, Severity::kLow);
  EXPECT_FALSE(merged.analysis.parallel);
}

class RunAnalyzeTest : public ::testing::Test {
protected:
  RunAnalyzeTest() {
    config_ = project_.AddFile("config.yaml", "log_level: error\n");
    project_.AddFile("src/app.py", "import os\n"
                                   "password = \"hunter2\"\n"
                                   "\n"
                                   "def run():\n"
                                   "    try:\n"
                                   "        os.remove('x')\n"
                                   "    except:\n"
                                   "        pass\n");
    project_.AddFile("src/clean.py", "def add(a, b):\n    return a + b\n");
  }

  std::vector<std::string> Arguments(std::vector<std::string> extra) const {
    std::vector<std::string> arguments = {(project_.root() / "src").string(),
                                          "--config", config_.string(),
                                          "--format", "json"};
    arguments.insert(arguments.end(), extra.begin(), extra.end());
    return arguments;
  }

  test::TemporaryProject project_;
  std::filesystem::path config_;
};

TEST_F(RunAnalyzeTest, CriticalFindingSetsExitCode) {
  std::ostringstream out;
  EXPECT_EQ(RunAnalyze(Arguments({}), out), kExitCritical);

  const auto result = ParseJsonReport(out.str());
  EXPECT_EQ(result.total_files, 2U);
  EXPECT_EQ(CountBySeverity(result, Severity::kCritical), 1U);

  const auto issues = AllIssues(result);
  ASSERT_FALSE(issues.empty());
  EXPECT_EQ(issues.front().rule_id, "hardcoded-password");
}

TEST_F(RunAnalyzeTest, DisablingSecurityDropsPasswordFinding) {
  std::ostringstream out;
  EXPECT_EQ(RunAnalyze(Arguments({"--no-security", "--sequential"}), out),
            kExitClean);

  const auto result = ParseJsonReport(out.str());
  EXPECT_EQ(CountBySeverity(result, Severity::kCritical), 0U);
  EXPECT_EQ(CountBySeverity(result, Severity::kMedium), 1U);
}

TEST_F(RunAnalyzeTest, MinimumSeverityFiltersReport) {
  std::ostringstream out;
  RunAnalyze(Arguments({"--min-severity", "critical"}), out);

  const auto result = ParseJsonReport(out.str());
  EXPECT_EQ(result.total_issues, 1U);
}

TEST_F(RunAnalyzeTest, AiExplainsTopIssues) {
  std::ostringstream out;
  RunAnalyze(Arguments({"--ai"}), out);

  const auto issues = AllIssues(ParseJsonReport(out.str()));
  ASSERT_FALSE(issues.empty());
  ASSERT_TRUE(issues.front().ai_explanation.has_value());
  EXPECT_THAT(*issues.front().ai_explanation, HasSubstr("Hardcoded Password"));
}

TEST_F(RunAnalyzeTest, WritesReportFile) {
  const auto target = project_.root() / "reports" / "out.json";
  std::ostringstream out;
  RunAnalyze(Arguments({"--out", target.string()}), out);

  EXPECT_THAT(out.str(), HasSubstr("Report written to"));
  EXPECT_EQ(LoadJsonReport(target).total_files, 2U);
}

TEST_F(RunAnalyzeTest, ReportCommandRerendersSavedReport) {
  const auto saved = project_.root() / "saved.json";
  std::ostringstream ignored;
  RunAnalyze(Arguments({"--out", saved.string()}), ignored);

  std::ostringstream sarif;
  EXPECT_EQ(RunReport({saved.string(), "--format", "sarif"}, sarif),
            kExitClean);
  EXPECT_THAT(sarif.str(), HasSubstr("\"ruleId\": \"hardcoded-password\""));

  std::ostringstream console;
  RunReport({saved.string(), "--min-severity", "critical"}, console);
  EXPECT_THAT(console.str(), HasSubstr("[CRITICAL] Hardcoded Password"));
  EXPECT_THAT(console.str(), ::testing::Not(HasSubstr("[MEDIUM]")));
}

TEST_F(RunAnalyzeTest, MissingPathIsAnError) {
  std::ostringstream out;
  EXPECT_THROW(RunAnalyze({"--format", "json"}, out), std::invalid_argument);
}

TEST(RunInitTest, WritesConfigOnce) {
  test::TemporaryProject project;
  const auto target = project.root() / ".codesage.yaml";
  std::ostringstream out;

  EXPECT_EQ(RunInit({"--out", target.string()}, out), kExitClean);
  EXPECT_THAT(out.str(), HasSubstr("Created configuration file"));
  EXPECT_TRUE(std::filesystem::is_regular_file(target));
  EXPECT_THROW(RunInit({"--out", target.string()}, out), std::exception);
}

TEST(PrintGlobalUsageTest, ListsCommandsAndExitCodes) {
  std::ostringstream out;
  PrintGlobalUsage(out);
  EXPECT_THAT(out.str(), HasSubstr("analyze"));
  EXPECT_THAT(out.str(), HasSubstr("report"));
  EXPECT_THAT(out.str(), HasSubstr("init"));
  EXPECT_THAT(out.str(), HasSubstr("2 critical"));
}

} // namespace
} // namespace sage
