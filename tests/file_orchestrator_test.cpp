#include <sage/errors.h>
#include <sage/file_orchestrator.h>
#include <sage/lexical_detector.h>
#include <sage/python_detector.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "test_support/test_doubles.h"

namespace sage {
namespace {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using test::MakeTestIssue;

// Reports one MEDIUM issue per file, named after the file.
FileRecord OneIssueRecord(const std::filesystem::path &path) {
  FileRecord record;
  record.file_path = path.string();
  record.language = "fake";
  record.issues.push_back(MakeTestIssue(path.string(), "fake_check", 1,
                                        Severity::kMedium, Category::kBug));
  return record;
}

class FileOrchestratorTest : public ::testing::Test {
protected:
  FileOrchestratorTest() : reader_(std::make_shared<test::InMemoryReader>()) {}

  std::unique_ptr<FileOrchestrator>
  MakeOrchestrator(DetectorRegistry registry,
                   std::vector<std::filesystem::path> files,
                   AnalysisSettings settings = {}) {
    return std::make_unique<FileOrchestrator>(
        settings, std::move(registry),
        MakeRuleCatalog(settings, {}, nullptr),
        std::make_shared<test::FixedDiscovery>(std::move(files)), reader_);
  }

  DetectorRegistry PythonRegistry(AnalysisSettings settings = {}) {
    DetectorRegistry registry;
    registry.Register(
        std::make_unique<PythonDetector>(settings, reader_, nullptr));
    return registry;
  }

  std::shared_ptr<test::InMemoryReader> reader_;
};

TEST_F(FileOrchestratorTest, RejectsNullDiscovery) {
  EXPECT_THROW(FileOrchestrator({}, DetectorRegistry(), RuleCatalog(), nullptr),
               std::invalid_argument);
}

TEST_F(FileOrchestratorTest, UnsupportedFileIsAFailedRecord) {
  reader_->Put("notes.md", "# hello\n");
  auto orchestrator = MakeOrchestrator(PythonRegistry(), {"notes.md"});

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(1u, result.files.size());
  const auto &record = result.files[0];
  EXPECT_FALSE(record.success);
  EXPECT_EQ("unknown", record.language);
  EXPECT_EQ("Unsupported file type: .md", record.error.value_or(""));
  EXPECT_TRUE(record.issues.empty());
}

TEST_F(FileOrchestratorTest, FileWithoutExtensionIsDescribed) {
  auto orchestrator = MakeOrchestrator(PythonRegistry(), {});

  const auto record = orchestrator->AnalyzeFile("Makefile");

  EXPECT_EQ("Unsupported file type: (none)", record.error.value_or(""));
}

TEST_F(FileOrchestratorTest, DetectorFaultDoesNotStopSiblings) {
  DetectorRegistry registry;
  registry.Register(std::make_unique<test::FakeDetector>(
      "boom", ".boom", [](const std::filesystem::path &) -> FileRecord {
        throw std::runtime_error("detector defect");
      }));
  registry.Register(
      std::make_unique<test::FakeDetector>("fake", ".ok", OneIssueRecord));
  reader_->Put("good.ok", "content\n");
  auto orchestrator =
      MakeOrchestrator(std::move(registry), {"bad.boom", "good.ok"});

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(2u, result.files.size());
  EXPECT_EQ("bad.boom", result.files[0].file_path);
  EXPECT_FALSE(result.files[0].success);
  EXPECT_EQ("detector defect", result.files[0].error.value_or(""));
  EXPECT_TRUE(result.files[0].issues.empty());
  EXPECT_TRUE(result.files[1].success);
  EXPECT_EQ(1u, result.files[1].issues.size());
}

TEST_F(FileOrchestratorTest, NonStandardThrowIsIsolatedToItsFile) {
  DetectorRegistry registry;
  registry.Register(std::make_unique<test::FakeDetector>(
      "wild", ".w", [](const std::filesystem::path &) -> FileRecord {
        throw 42;
      }));
  registry.Register(
      std::make_unique<test::FakeDetector>("fake", ".f", OneIssueRecord));
  reader_->Put("a.f", "content\n");
  reader_->Put("c.f", "content\n");
  AnalysisSettings settings;
  settings.parallel = true;
  settings.max_workers = 3;
  auto orchestrator = MakeOrchestrator(std::move(registry),
                                       {"a.f", "b.w", "c.f"}, settings);

  const auto records = orchestrator->AnalyzeFiles({"a.f", "b.w", "c.f"});

  ASSERT_EQ(3u, records.size());
  EXPECT_TRUE(records[0].success);
  EXPECT_EQ("b.w", records[1].file_path);
  EXPECT_FALSE(records[1].success);
  EXPECT_EQ("wild", records[1].language);
  EXPECT_EQ("unexpected detector fault", records[1].error.value_or(""));
  EXPECT_TRUE(records[1].issues.empty());
  EXPECT_TRUE(records[2].success);
}

TEST_F(FileOrchestratorTest, FaultWhileSelectingDetectorIsIsolated) {
  auto faulty = std::make_unique<test::MockDetector>();
  EXPECT_CALL(*faulty, CanAnalyze(_)).WillRepeatedly(Throw(42));
  DetectorRegistry registry;
  registry.Register(std::move(faulty));
  auto orchestrator = MakeOrchestrator(std::move(registry), {"x.py", "y.py"});

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(2u, result.files.size());
  for (const auto &record : result.files) {
    EXPECT_FALSE(record.success);
    EXPECT_EQ("unknown", record.language);
    EXPECT_EQ("unexpected detector fault", record.error.value_or(""));
  }
}

TEST_F(FileOrchestratorTest, DeeplyNestedSourceDoesNotAbortTheRun) {
  reader_->Put("ok.py", "x = 1\n");
  reader_->Put("deep.py", "x = " + std::string(20000, '[') +
                              std::string(20000, ']') + "\n");
  auto orchestrator =
      MakeOrchestrator(PythonRegistry(), {"deep.py", "ok.py"});

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(2u, result.files.size());
  EXPECT_EQ("deep.py", result.files[0].file_path);
  EXPECT_TRUE(result.files[0].success);
  ASSERT_EQ(1u, result.files[0].issues.size());
  EXPECT_EQ(Severity::kCritical, result.files[0].issues[0].severity);
  EXPECT_TRUE(result.files[1].success);
}

TEST_F(FileOrchestratorTest, PatternRulesRunAlongsideTheDetector) {
  reader_->Put("app.py", "def f(a, b, c, d, e, f, g):\n"
                         "    password = \"super_secret_123\"\n"
                         "    return a\n");
  auto orchestrator = MakeOrchestrator(PythonRegistry(), {"app.py"});

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(1u, result.files.size());
  const auto &issues = result.files[0].issues;
  ASSERT_EQ(2u, issues.size());
  EXPECT_EQ("hardcoded-password", issues[0].rule_id.value_or(""));
  EXPECT_EQ(2, issues[0].location.line_start);
  EXPECT_EQ("Too Many Parameters: f", issues[1].title);
}

TEST_F(FileOrchestratorTest, SecurityRulesCanBeDisabled) {
  AnalysisSettings settings;
  settings.enable_security = false;
  reader_->Put("app.py", "password = \"super_secret_123\"\n");
  auto orchestrator =
      MakeOrchestrator(PythonRegistry(settings), {"app.py"}, settings);

  const auto result = orchestrator->AnalyzeProject("root");

  EXPECT_EQ(0u, result.total_issues);
  EXPECT_EQ(nullptr, orchestrator->catalog().Find("hardcoded-password"));
}

TEST_F(FileOrchestratorTest, DuplicatesAcrossDetectorsAreRemoved) {
  DetectorRegistry registry;
  registry.Register(std::make_unique<test::FakeDetector>(
      "fake", ".x", [](const std::filesystem::path &path) {
        auto record = OneIssueRecord(path);
        record.issues.push_back(record.issues.front());
        return record;
      }));
  reader_->Put("one.x", "");
  auto orchestrator = MakeOrchestrator(std::move(registry), {"one.x"});

  const auto result = orchestrator->AnalyzeProject("root");

  EXPECT_EQ(1u, result.total_issues);
}

TEST_F(FileOrchestratorTest, IssuesAreRankedWithinEachFile) {
  DetectorRegistry registry;
  registry.Register(std::make_unique<test::FakeDetector>(
      "fake", ".x", [](const std::filesystem::path &path) {
        FileRecord record;
        record.file_path = path.string();
        record.language = "fake";
        record.issues = {
            MakeTestIssue(path.string(), "minor", 1, Severity::kLow,
                          Category::kStyle),
            MakeTestIssue(path.string(), "major", 2, Severity::kCritical,
                          Category::kSecurity)};
        return record;
      }));
  reader_->Put("a.x", "");
  reader_->Put("b.x", "");
  auto orchestrator = MakeOrchestrator(std::move(registry), {"b.x", "a.x"});

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(2u, result.files.size());
  EXPECT_EQ("a.x", result.files[0].file_path);
  for (const auto &file : result.files) {
    ASSERT_EQ(2u, file.issues.size());
    EXPECT_EQ("major", file.issues[0].title);
    EXPECT_EQ(file.file_path, file.issues[0].location.file_path);
  }
  EXPECT_EQ(2u, result.summary.by_severity.at(Severity::kCritical));
}

TEST_F(FileOrchestratorTest, ConcurrentRunMatchesSequentialRun) {
  std::vector<std::filesystem::path> files;
  for (int i = 0; i < 40; ++i) {
    const auto name = "module_" + std::to_string(i) + ".py";
    reader_->Put(name, "try:\n    run()\nexcept:\n    pass\n"
                       "print('done')\n");
    files.emplace_back(name);
  }
  AnalysisSettings sequential;
  sequential.parallel = false;
  AnalysisSettings concurrent;
  concurrent.parallel = true;
  concurrent.max_workers = 8;

  const auto one = MakeOrchestrator(PythonRegistry(), files, sequential)
                       ->AnalyzeProject("root");
  const auto many = MakeOrchestrator(PythonRegistry(), files, concurrent)
                        ->AnalyzeProject("root");

  ASSERT_EQ(one.files.size(), many.files.size());
  for (std::size_t i = 0; i < one.files.size(); ++i) {
    EXPECT_EQ(one.files[i].file_path, many.files[i].file_path);
    ASSERT_EQ(one.files[i].issues.size(), many.files[i].issues.size());
    for (std::size_t k = 0; k < one.files[i].issues.size(); ++k) {
      EXPECT_EQ(one.files[i].issues[k].id, many.files[i].issues[k].id);
    }
  }
  EXPECT_EQ(one.total_issues, many.total_issues);
}

TEST_F(FileOrchestratorTest, CancelledRunThrows) {
  reader_->Put("a.py", "x = 1\n");
  auto orchestrator = MakeOrchestrator(PythonRegistry(), {"a.py"});

  orchestrator->Cancel();

  EXPECT_TRUE(orchestrator->cancelled());
  EXPECT_THROW(orchestrator->AnalyzeProject("root"), AnalysisCancelled);
}

TEST_F(FileOrchestratorTest, EnricherSeesOnlyTheTopIssues) {
  reader_->Put("app.py", "password = \"super_secret_123\"\n"
                         "print(password)\n"
                         "# TODO: rotate\n");
  auto orchestrator = MakeOrchestrator(PythonRegistry(), {"app.py"});
  auto enricher = std::make_shared<test::MockEnricher>();
  Enrichment enrichment;
  enrichment.explanation = "explained";
  EXPECT_CALL(*enricher, Enrich(_)).Times(2).WillRepeatedly(Return(enrichment));
  orchestrator->SetEnricher(enricher, 2);

  const auto result = orchestrator->AnalyzeProject("root");

  const auto &issues = result.files[0].issues;
  ASSERT_EQ(3u, issues.size());
  EXPECT_EQ("explained", issues[0].ai_explanation.value_or(""));
  EXPECT_EQ("explained", issues[1].ai_explanation.value_or(""));
  EXPECT_FALSE(issues[2].ai_explanation.has_value());
}

TEST_F(FileOrchestratorTest, FailingEnricherLeavesIssuesIntact) {
  reader_->Put("app.py", "password = \"super_secret_123\"\n");
  auto orchestrator = MakeOrchestrator(PythonRegistry(), {"app.py"});
  auto enricher = std::make_shared<test::MockEnricher>();
  EXPECT_CALL(*enricher, Enrich(_))
      .WillOnce(::testing::Throw(std::runtime_error("service down")));
  orchestrator->SetEnricher(enricher, 5);

  const auto result = orchestrator->AnalyzeProject("root");

  ASSERT_EQ(1u, result.total_issues);
  EXPECT_FALSE(result.files[0].issues[0].ai_explanation.has_value());
}

TEST_F(FileOrchestratorTest, LogsRunMilestones) {
  std::stringstream log;
  auto logger =
      std::make_shared<StructuredLogger>(log, LoggingConfig{LogLevel::kInfo});
  reader_->Put("a.py", "x = 1\n");
  FileOrchestrator orchestrator(
      {}, PythonRegistry(), MakeRuleCatalog({}, {}, logger),
      std::make_shared<test::FixedDiscovery>(
          std::vector<std::filesystem::path>{"a.py"}),
      reader_, logger);

  orchestrator.AnalyzeProject("root");

  EXPECT_NE(std::string::npos, log.str().find("orchestrator.discovered"));
  EXPECT_NE(std::string::npos, log.str().find("orchestrator.completed"));
}

TEST(MakeRuleCatalogTest, AddsCustomRulesToBuiltins) {
  RuleDefinition custom;
  custom.id = "no-exec";
  custom.name = "Exec";
  custom.pattern = "exec\\(";
  custom.languages = {"python"};

  const auto catalog = MakeRuleCatalog({}, {custom}, nullptr);

  EXPECT_TRUE(catalog.frozen());
  EXPECT_NE(nullptr, catalog.Find("no-exec"));
  EXPECT_EQ(BuiltinRuleDefinitions().size() + 1, catalog.size());
}

} // namespace
} // namespace sage
