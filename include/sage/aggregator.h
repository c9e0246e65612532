#pragma once

#include <sage/models.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sage {

struct IssueFilter {
  std::optional<Severity> min_severity;
  // Empty means every category passes.
  std::vector<Category> categories;
  bool auto_fixable_only = false;
};

struct SimilarGroup {
  std::string representative_id;
  std::vector<Issue> members;
};

// Ratcliff/Obershelp ratio 2*M/T in [0, 1]; 1.0 for two empty strings.
double SimilarityRatio(std::string_view left, std::string_view right);

double PriorityScore(const Issue &issue);

class IssueAggregator {
public:
  explicit IssueAggregator(double similarity_threshold = 0.8);

  // Keeps the first issue per (file, start line, title, category).
  std::vector<Issue> Deduplicate(const std::vector<Issue> &issues) const;

  // Each issue is compared with the first member of earlier groups only, so
  // chains of near matches may end up in separate groups.
  std::vector<SimilarGroup> FindSimilar(const std::vector<Issue> &issues) const;

  // Stable, highest priority first.
  std::vector<Issue> Rank(std::vector<Issue> issues) const;

  std::vector<Issue> Filter(const std::vector<Issue> &issues,
                            const IssueFilter &filter) const;

  Summary Summarize(const std::vector<FileRecord> &files) const;

  double similarity_threshold() const { return similarity_threshold_; }

private:
  bool AreSimilar(const Issue &left, const Issue &right) const;

  double similarity_threshold_;
};

} // namespace sage
