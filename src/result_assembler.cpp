#include <sage/result_assembler.h>

#include <ctime>
#include <utility>

namespace sage {

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
  const auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

ProjectResult AssembleResult(const std::string &project_path,
                             std::vector<FileRecord> files, double total_time,
                             const IssueAggregator &aggregator) {
  ProjectResult result;
  result.project_path = project_path;
  result.timestamp = FormatTimestamp(std::chrono::system_clock::now());
  result.files = std::move(files);
  result.total_files = result.files.size();
  result.total_time = total_time;
  for (const auto &file : result.files) {
    ++result.languages[file.language];
    result.total_issues += file.issues.size();
  }
  result.summary = aggregator.Summarize(result.files);
  return result;
}

ProjectResult FilterResult(ProjectResult result, const IssueFilter &filter,
                           const IssueAggregator &aggregator) {
  result.total_issues = 0;
  for (auto &file : result.files) {
    file.issues = aggregator.Filter(file.issues, filter);
    result.total_issues += file.issues.size();
  }
  result.summary = aggregator.Summarize(result.files);
  return result;
}

std::size_t CountBySeverity(const ProjectResult &result, Severity severity) {
  std::size_t count = 0;
  for (const auto &file : result.files) {
    for (const auto &issue : file.issues) {
      if (issue.severity == severity) {
        ++count;
      }
    }
  }
  return count;
}

std::vector<Issue> AllIssues(const ProjectResult &result) {
  std::vector<Issue> issues;
  for (const auto &file : result.files) {
    issues.insert(issues.end(), file.issues.begin(), file.issues.end());
  }
  return issues;
}

} // namespace sage
