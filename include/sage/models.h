#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sage {

enum class Severity { kInfo, kLow, kMedium, kHigh, kCritical };

enum class Category {
  kSecurity,
  kBug,
  kCodeSmell,
  kTypeError,
  kStyle,
  kPerformance,
  kBestPractice,
  kDuplication,
  kComplexity,
  kMaintainability
};

struct Location {
  std::string file_path;
  int line_start = 1;
  int line_end = 1;
  std::optional<int> column_start;
  std::optional<int> column_end;
};

struct Issue {
  std::string id;
  std::string title;
  std::string description;
  Severity severity = Severity::kInfo;
  Category category = Category::kCodeSmell;
  Location location;
  std::optional<std::string> code_snippet;
  std::optional<std::string> suggested_fix;
  std::optional<std::string> fix_description;
  // Only ever written by an IssueEnricher.
  std::optional<std::string> ai_explanation;
  double confidence = 1.0;
  bool auto_fixable = false;
  std::optional<std::string> rule_id;
  std::vector<std::string> references;
  std::map<std::string, std::string> metadata;
};

struct CodeMetrics {
  int lines_of_code = 0;
  int source_lines_of_code = 0;
  int comment_lines = 0;
  int blank_lines = 0;
  int function_count = 0;
  double cyclomatic_complexity = 0.0;
  int max_complexity = 0;
};

struct FileRecord {
  std::string file_path;
  std::string language;
  std::vector<Issue> issues;
  std::optional<CodeMetrics> metrics;
  double analysis_time = 0.0;
  bool success = true;
  std::optional<std::string> error;
};

struct Summary {
  std::size_t total_issues = 0;
  std::map<Severity, std::size_t> by_severity;
  std::map<Category, std::size_t> by_category;
  // Sorted by descending issue count.
  std::vector<std::pair<std::string, std::size_t>> by_file;
  std::size_t auto_fixable = 0;
  std::size_t high_priority = 0;
  std::size_t files_with_issues = 0;
  std::size_t files_without_issues = 0;
};

struct ProjectResult {
  std::string project_path;
  std::string timestamp;
  std::vector<FileRecord> files;
  std::size_t total_files = 0;
  std::size_t total_issues = 0;
  double total_time = 0.0;
  std::map<std::string, std::size_t> languages;
  Summary summary;
};

struct AnalysisSettings {
  int max_complexity = 15;
  int max_function_length = 50;
  int max_parameters = 5;
  bool parallel = true;
  std::size_t max_workers = 4;
  double similarity_threshold = 0.8;
  bool enable_security = true;
};

} // namespace sage
