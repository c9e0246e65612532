#include <sage/console_reporter.h>

#include <sage/escaping.h>
#include <sage/taxonomy.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace sage {
namespace {

std::string Upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::toupper(character));
                 });
  return value;
}

std::string FormatLocation(const Location &location) {
  std::string text =
      location.file_path + ":" + std::to_string(location.line_start);
  if (location.column_start) {
    text += ":" + std::to_string(*location.column_start);
  }
  return text;
}

void WriteSummary(std::ostringstream &output, const ProjectResult &result) {
  output << "Code Sage analysis of " << result.project_path << "\n\n";
  output << std::left;
  output << "  " << std::setw(16) << "Files" << result.total_files << "\n";
  output << "  " << std::setw(16) << "Issues" << result.total_issues << "\n";
  output << "  " << std::setw(16) << "High priority"
         << result.summary.high_priority << "\n";
  output << "  " << std::setw(16) << "Auto-fixable"
         << result.summary.auto_fixable << "\n";
  output << "  " << std::setw(16) << "Time"
         << FormatDouble(result.total_time, 2) << "s\n\n";

  output << "  Severity    Count\n";
  output << "  ----------  -----\n";
  const auto &severities = AllSeverities();
  for (auto it = severities.rbegin(); it != severities.rend(); ++it) {
    const auto found = result.summary.by_severity.find(*it);
    const auto count =
        found == result.summary.by_severity.end() ? 0 : found->second;
    if (count == 0) {
      continue;
    }
    output << "  " << std::setw(10) << Upper(SeverityName(*it)) << "  "
           << count << "\n";
  }
  output << "\n";
}

void WriteIssue(std::ostringstream &output, const Issue &issue,
                bool show_snippet) {
  output << "  [" << Upper(SeverityName(issue.severity)) << "] "
         << issue.title << "  (" << CategoryName(issue.category)
         << (issue.auto_fixable ? ", auto-fixable" : "") << ")\n";
  output << "    at " << FormatLocation(issue.location) << "\n";
  if (!issue.description.empty()) {
    output << "    " << issue.description << "\n";
  }
  if (issue.suggested_fix) {
    output << "    fix: " << *issue.suggested_fix << "\n";
  }
  if (issue.ai_explanation) {
    output << "    note: " << *issue.ai_explanation << "\n";
  }
  if (show_snippet && issue.code_snippet) {
    std::istringstream lines(*issue.code_snippet);
    std::string line;
    while (std::getline(lines, line)) {
      output << "      " << line << "\n";
    }
  }
}

} // namespace

std::string ConsoleReporter::Render(const ProjectResult &result) const {
  std::ostringstream output;
  WriteSummary(output, result);

  for (const auto &file : result.files) {
    if (!file.success) {
      output << file.file_path << " (" << file.language << "): FAILED - "
             << file.error.value_or("unknown error") << "\n\n";
      continue;
    }
    if (file.issues.empty()) {
      continue;
    }
    output << file.file_path << " (" << file.language << ", "
           << file.issues.size() << " issue"
           << (file.issues.size() == 1 ? "" : "s") << ")\n";
    for (const auto &issue : file.issues) {
      WriteIssue(output, issue, show_snippets_);
    }
    output << "\n";
  }

  if (result.total_issues == 0) {
    output << "No issues found.\n";
  }
  return output.str();
}

} // namespace sage
