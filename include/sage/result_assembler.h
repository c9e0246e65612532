#pragma once

#include <sage/aggregator.h>
#include <sage/models.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace sage {

// ISO-8601 UTC, second precision: 2024-05-01T12:30:00Z.
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

ProjectResult AssembleResult(const std::string &project_path,
                             std::vector<FileRecord> files, double total_time,
                             const IssueAggregator &aggregator);

// Applies `filter` to every record and recomputes totals and summary. The
// timestamp and timings are kept.
ProjectResult FilterResult(ProjectResult result, const IssueFilter &filter,
                           const IssueAggregator &aggregator);

std::size_t CountBySeverity(const ProjectResult &result, Severity severity);

std::vector<Issue> AllIssues(const ProjectResult &result);

} // namespace sage
