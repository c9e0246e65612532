#include <sage/aggregator.h>

#include <sage/taxonomy.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace sage {
namespace {

struct Block {
  std::size_t left = 0;
  std::size_t right = 0;
  std::size_t size = 0;
};

// Longest common run; ties go to the earliest start in `left`, then in
// `right`.
Block LongestMatch(std::string_view left, std::string_view right) {
  Block best;
  std::vector<std::size_t> previous(right.size() + 1, 0);
  std::vector<std::size_t> current(right.size() + 1, 0);
  for (std::size_t i = 0; i < left.size(); ++i) {
    for (std::size_t j = 0; j < right.size(); ++j) {
      current[j + 1] = left[i] == right[j] ? previous[j] + 1 : 0;
      const auto length = current[j + 1];
      if (length > best.size) {
        best = Block{i + 1 - length, j + 1 - length, length};
      }
    }
    std::swap(previous, current);
  }
  return best;
}

std::size_t MatchedCharacters(std::string_view left, std::string_view right) {
  if (left.empty() || right.empty()) {
    return 0;
  }
  const auto block = LongestMatch(left, right);
  if (block.size == 0) {
    return 0;
  }
  return block.size +
         MatchedCharacters(left.substr(0, block.left),
                           right.substr(0, block.right)) +
         MatchedCharacters(left.substr(block.left + block.size),
                           right.substr(block.right + block.size));
}

} // namespace

double SimilarityRatio(std::string_view left, std::string_view right) {
  const auto total = left.size() + right.size();
  if (total == 0) {
    return 1.0;
  }
  return 2.0 * static_cast<double>(MatchedCharacters(left, right)) /
         static_cast<double>(total);
}

double PriorityScore(const Issue &issue) {
  double score = static_cast<double>(SeverityWeight(issue.severity) +
                                     CategoryWeight(issue.category)) *
                 issue.confidence;
  if (issue.auto_fixable) {
    score += 5.0;
  }
  return score;
}

IssueAggregator::IssueAggregator(double similarity_threshold)
    : similarity_threshold_(similarity_threshold) {
  if (similarity_threshold_ < 0.0 || similarity_threshold_ > 1.0) {
    throw std::invalid_argument("Similarity threshold must lie in [0, 1]");
  }
}

std::vector<Issue>
IssueAggregator::Deduplicate(const std::vector<Issue> &issues) const {
  using Signature = std::tuple<std::string, int, std::string, Category>;
  std::set<Signature> seen;
  std::vector<Issue> unique;
  for (const auto &issue : issues) {
    Signature signature{issue.location.file_path, issue.location.line_start,
                        issue.title, issue.category};
    if (seen.insert(std::move(signature)).second) {
      unique.push_back(issue);
    }
  }
  return unique;
}

bool IssueAggregator::AreSimilar(const Issue &left, const Issue &right) const {
  if (left.category != right.category || left.severity != right.severity) {
    return false;
  }
  if (SimilarityRatio(left.title, right.title) < similarity_threshold_) {
    return false;
  }
  return SimilarityRatio(left.description, right.description) >=
         similarity_threshold_;
}

std::vector<SimilarGroup>
IssueAggregator::FindSimilar(const std::vector<Issue> &issues) const {
  std::vector<SimilarGroup> groups;
  std::vector<bool> grouped(issues.size(), false);
  for (std::size_t i = 0; i < issues.size(); ++i) {
    if (grouped[i]) {
      continue;
    }
    grouped[i] = true;
    SimilarGroup group{issues[i].id, {issues[i]}};
    for (std::size_t j = i + 1; j < issues.size(); ++j) {
      if (!grouped[j] && AreSimilar(issues[i], issues[j])) {
        grouped[j] = true;
        group.members.push_back(issues[j]);
      }
    }
    if (group.members.size() > 1) {
      groups.push_back(std::move(group));
    }
  }
  return groups;
}

std::vector<Issue> IssueAggregator::Rank(std::vector<Issue> issues) const {
  std::stable_sort(issues.begin(), issues.end(),
                   [](const Issue &left, const Issue &right) {
                     return PriorityScore(left) > PriorityScore(right);
                   });
  return issues;
}

std::vector<Issue> IssueAggregator::Filter(const std::vector<Issue> &issues,
                                           const IssueFilter &filter) const {
  std::vector<Issue> kept;
  for (const auto &issue : issues) {
    if (filter.min_severity &&
        !IsAtLeast(issue.severity, *filter.min_severity)) {
      continue;
    }
    if (!filter.categories.empty() &&
        std::find(filter.categories.begin(), filter.categories.end(),
                  issue.category) == filter.categories.end()) {
      continue;
    }
    if (filter.auto_fixable_only && !issue.auto_fixable) {
      continue;
    }
    kept.push_back(issue);
  }
  return kept;
}

Summary IssueAggregator::Summarize(const std::vector<FileRecord> &files) const {
  Summary summary;
  for (const auto severity : AllSeverities()) {
    summary.by_severity[severity] = 0;
  }
  for (const auto category : AllCategories()) {
    summary.by_category[category] = 0;
  }
  for (const auto &file : files) {
    if (file.issues.empty()) {
      ++summary.files_without_issues;
      continue;
    }
    ++summary.files_with_issues;
    summary.by_file.emplace_back(file.file_path, file.issues.size());
    for (const auto &issue : file.issues) {
      ++summary.total_issues;
      ++summary.by_severity[issue.severity];
      ++summary.by_category[issue.category];
      if (issue.auto_fixable) {
        ++summary.auto_fixable;
      }
      if (IsHighPriority(issue.severity)) {
        ++summary.high_priority;
      }
    }
  }
  std::sort(summary.by_file.begin(), summary.by_file.end(),
            [](const auto &left, const auto &right) {
              if (left.second != right.second) {
                return left.second > right.second;
              }
              return left.first < right.first;
            });
  return summary;
}

} // namespace sage
