#include <sage/file_orchestrator.h>

#include <sage/enrichment.h>
#include <sage/errors.h>
#include <sage/issue_factory.h>
#include <sage/result_assembler.h>
#include <sage/source_reader.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace sage {
namespace {

void SortByPath(std::vector<FileRecord> &records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const FileRecord &left, const FileRecord &right) {
                     return left.file_path < right.file_path;
                   });
}

std::string DescribeExtension(const std::filesystem::path &path) {
  const auto extension = path.extension().string();
  return extension.empty() ? "(none)" : extension;
}

} // namespace

RuleCatalog MakeRuleCatalog(const AnalysisSettings &settings,
                            const std::vector<RuleDefinition> &custom_rules,
                            const std::shared_ptr<Logger> &logger) {
  auto definitions = BuiltinRuleDefinitions();
  definitions.insert(definitions.end(), custom_rules.begin(),
                     custom_rules.end());
  if (!settings.enable_security) {
    definitions = WithoutCategory(std::move(definitions), Category::kSecurity);
  }
  RuleCatalog catalog(logger);
  catalog.AddRules(std::move(definitions));
  catalog.Freeze();
  return catalog;
}

FileOrchestrator::FileOrchestrator(
    AnalysisSettings settings, DetectorRegistry registry, RuleCatalog catalog,
    std::shared_ptr<const FileDiscovery> discovery,
    std::shared_ptr<const SourceReader> reader, std::shared_ptr<Logger> logger)
    : settings_(settings), registry_(std::move(registry)),
      catalog_(std::move(catalog)), pattern_detector_(catalog_),
      aggregator_(settings.similarity_threshold),
      discovery_(std::move(discovery)), reader_(std::move(reader)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!discovery_) {
    throw std::invalid_argument("File discovery cannot be null");
  }
  if (!reader_) {
    reader_ = std::make_shared<FileSourceReader>();
  }
  registry_.Freeze();
  catalog_.Freeze();
}

void FileOrchestrator::SetEnricher(std::shared_ptr<IssueEnricher> enricher,
                                   std::size_t max_issues) {
  enricher_ = std::move(enricher);
  max_enriched_ = max_issues;
}

FileRecord FileOrchestrator::AnalyzeFile(const std::filesystem::path &path) const {
  try {
    return RunFilePipeline(path);
  } catch (const std::exception &error) {
    return RecordFault(path, error.what());
  } catch (...) {
    return RecordFault(path, "unexpected detector fault");
  }
}

FileRecord FileOrchestrator::RecordFault(const std::filesystem::path &path,
                                         const std::string &message) const {
  logger_->Log(LogLevel::kError, "orchestrator.file.fault",
               {{"path", path.string()}, {"error", message}});
  return MakeFailedRecord(path.string(), "unknown", message);
}

FileRecord
FileOrchestrator::RunFilePipeline(const std::filesystem::path &path) const {
  const auto file_path = path.string();
  const auto *detector = registry_.GetDetector(path);
  if (detector == nullptr) {
    const auto message = "Unsupported file type: " + DescribeExtension(path);
    logger_->Log(LogLevel::kWarn, "orchestrator.file.unsupported",
                 {{"path", file_path}, {"error", message}});
    return MakeFailedRecord(file_path, "unknown", message);
  }

  logger_->Log(LogLevel::kDebug, "orchestrator.file.started",
               {{"path", file_path}, {"language", detector->Language()}});
  auto record = AnalyzeWithTiming(*detector, path);
  if (!record.success) {
    logger_->Log(LogLevel::kWarn, "orchestrator.file.failed",
                 {{"path", file_path}, {"error", record.error.value_or("")}});
    return record;
  }

  try {
    const auto content = reader_->Read(path);
    auto matches =
        pattern_detector_.MatchFile(file_path, content, record.language);
    record.issues.insert(record.issues.end(),
                         std::make_move_iterator(matches.begin()),
                         std::make_move_iterator(matches.end()));
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "orchestrator.file.failed",
                 {{"path", file_path}, {"error", error.what()}});
    auto failed = MakeFailedRecord(file_path, record.language, error.what());
    failed.analysis_time = record.analysis_time;
    return failed;
  }

  logger_->Log(LogLevel::kDebug, "orchestrator.file.completed",
               {{"path", file_path},
                {"issues", std::to_string(record.issues.size())}});
  return record;
}

std::vector<FileRecord> FileOrchestrator::AnalyzeSequential(
    const std::vector<std::filesystem::path> &files) const {
  std::vector<FileRecord> records;
  records.reserve(files.size());
  for (const auto &file : files) {
    if (cancelled()) {
      break;
    }
    records.push_back(AnalyzeFile(file));
  }
  return records;
}

std::vector<FileRecord> FileOrchestrator::AnalyzeConcurrent(
    const std::vector<std::filesystem::path> &files, std::size_t workers) const {
  std::atomic<std::size_t> next{0};
  const auto worker = [&]() {
    std::vector<FileRecord> produced;
    while (!cancelled()) {
      const auto index = next.fetch_add(1);
      if (index >= files.size()) {
        break;
      }
      produced.push_back(AnalyzeFile(files[index]));
    }
    return produced;
  };

  std::vector<std::future<std::vector<FileRecord>>> futures;
  futures.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }

  std::vector<FileRecord> records;
  records.reserve(files.size());
  std::exception_ptr first_error;
  for (auto &future : futures) {
    try {
      auto produced = future.get();
      records.insert(records.end(), std::make_move_iterator(produced.begin()),
                     std::make_move_iterator(produced.end()));
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return records;
}

std::vector<FileRecord> FileOrchestrator::AnalyzeFiles(
    const std::vector<std::filesystem::path> &files) const {
  const auto workers =
      std::min<std::size_t>(std::max<std::size_t>(settings_.max_workers, 1),
                            files.size());
  std::vector<FileRecord> records;
  if (!settings_.parallel || workers <= 1) {
    records = AnalyzeSequential(files);
  } else {
    logger_->Log(LogLevel::kDebug, "orchestrator.workers.started",
                 {{"workers", std::to_string(workers)}});
    records = AnalyzeConcurrent(files, workers);
  }
  if (cancelled()) {
    logger_->Log(LogLevel::kWarn, "orchestrator.cancelled",
                 {{"completed", std::to_string(records.size())},
                  {"files", std::to_string(files.size())}});
    throw AnalysisCancelled();
  }
  SortByPath(records);
  return records;
}

void FileOrchestrator::RankAcrossProject(
    std::vector<FileRecord> &records) const {
  std::vector<Issue> all_issues;
  for (const auto &record : records) {
    all_issues.insert(all_issues.end(), record.issues.begin(),
                      record.issues.end());
  }
  const auto found = all_issues.size();
  auto ranked = aggregator_.Rank(aggregator_.Deduplicate(all_issues));
  logger_->Log(LogLevel::kDebug, "orchestrator.aggregated",
               {{"issues", std::to_string(found)},
                {"unique", std::to_string(ranked.size())}});

  if (enricher_) {
    EnrichTopIssues(ranked, *enricher_, max_enriched_, logger_);
  }

  std::map<std::string, std::vector<Issue>> by_file;
  for (auto &issue : ranked) {
    by_file[issue.location.file_path].push_back(std::move(issue));
  }
  for (auto &record : records) {
    auto found_issues = by_file.find(record.file_path);
    if (found_issues == by_file.end()) {
      record.issues = {};
      continue;
    }
    record.issues = std::move(found_issues->second);
    by_file.erase(found_issues);
  }
}

ProjectResult FileOrchestrator::AnalyzeProject(const std::filesystem::path &root) {
  const auto start = std::chrono::steady_clock::now();
  const auto files = discovery_->Discover(root);
  logger_->Log(LogLevel::kInfo, "orchestrator.discovered",
               {{"root", root.string()},
                {"files", std::to_string(files.size())}});

  auto records = AnalyzeFiles(files);
  RankAcrossProject(records);

  const auto elapsed = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - start)
                           .count();
  auto result =
      AssembleResult(root.string(), std::move(records), elapsed, aggregator_);
  logger_->Log(LogLevel::kInfo, "orchestrator.completed",
               {{"files", std::to_string(result.total_files)},
                {"issues", std::to_string(result.total_issues)},
                {"seconds", std::to_string(result.total_time)}});
  return result;
}

} // namespace sage
