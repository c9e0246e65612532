#pragma once

#include <sage/aggregator.h>
#include <sage/detector_registry.h>
#include <sage/interfaces.h>
#include <sage/logging.h>
#include <sage/models.h>
#include <sage/pattern_detector.h>
#include <sage/rule_catalog.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace sage {

// Built-in rules plus `custom_rules`, minus the security category when
// security scanning is disabled. The returned catalog is frozen.
RuleCatalog MakeRuleCatalog(const AnalysisSettings &settings,
                            const std::vector<RuleDefinition> &custom_rules,
                            const std::shared_ptr<Logger> &logger);

class FileOrchestrator {
public:
  FileOrchestrator(AnalysisSettings settings, DetectorRegistry registry,
                   RuleCatalog catalog,
                   std::shared_ptr<const FileDiscovery> discovery,
                   std::shared_ptr<const SourceReader> reader = nullptr,
                   std::shared_ptr<Logger> logger = nullptr);

  FileOrchestrator(const FileOrchestrator &) = delete;
  FileOrchestrator &operator=(const FileOrchestrator &) = delete;

  // Enriches the top `max_issues` ranked issues of each project run.
  void SetEnricher(std::shared_ptr<IssueEnricher> enricher,
                   std::size_t max_issues);

  // Throws FileAccessError for a missing root and AnalysisCancelled when
  // Cancel() was called before the run finished.
  ProjectResult AnalyzeProject(const std::filesystem::path &root);

  // Records sorted by path, issues as the detectors produced them.
  std::vector<FileRecord>
  AnalyzeFiles(const std::vector<std::filesystem::path> &files) const;

  // Never throws for per-file failures; they come back as failed records.
  FileRecord AnalyzeFile(const std::filesystem::path &path) const;

  // Workers finish their current file and take no new ones. Irreversible.
  void Cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

  const DetectorRegistry &registry() const { return registry_; }
  const RuleCatalog &catalog() const { return catalog_; }
  const IssueAggregator &aggregator() const { return aggregator_; }

private:
  FileRecord RunFilePipeline(const std::filesystem::path &path) const;
  FileRecord RecordFault(const std::filesystem::path &path,
                         const std::string &message) const;
  std::vector<FileRecord>
  AnalyzeSequential(const std::vector<std::filesystem::path> &files) const;
  std::vector<FileRecord>
  AnalyzeConcurrent(const std::vector<std::filesystem::path> &files,
                    std::size_t workers) const;
  void RankAcrossProject(std::vector<FileRecord> &records) const;

  AnalysisSettings settings_;
  DetectorRegistry registry_;
  RuleCatalog catalog_;
  PatternDetector pattern_detector_;
  IssueAggregator aggregator_;
  std::shared_ptr<const FileDiscovery> discovery_;
  std::shared_ptr<const SourceReader> reader_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<IssueEnricher> enricher_;
  std::size_t max_enriched_ = 0;
  std::atomic<bool> cancelled_{false};
};

} // namespace sage
