#include <sage/code_metrics.h>

#include <algorithm>
#include <numeric>

namespace sage {
namespace {

std::string Strip(const std::string &line) {
  const auto first = line.find_first_not_of(" \t\f\v");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = line.find_last_not_of(" \t\f\v");
  return line.substr(first, last - first + 1);
}

} // namespace

CodeMetrics CountLines(const std::vector<std::string> &lines,
                       CommentStyle style) {
  CodeMetrics metrics;
  metrics.lines_of_code = static_cast<int>(lines.size());
  bool in_block_comment = false;
  for (const auto &line : lines) {
    const auto stripped = Strip(line);
    if (in_block_comment) {
      ++metrics.comment_lines;
      if (stripped.find("*/") != std::string::npos) {
        in_block_comment = false;
      }
      continue;
    }
    if (stripped.empty()) {
      ++metrics.blank_lines;
      continue;
    }
    if (style == CommentStyle::kHash) {
      if (stripped.front() == '#') {
        ++metrics.comment_lines;
      }
      continue;
    }
    if (stripped.rfind("//", 0) == 0) {
      ++metrics.comment_lines;
      continue;
    }
    if (stripped.rfind("/*", 0) == 0) {
      ++metrics.comment_lines;
      in_block_comment = stripped.find("*/", 2) == std::string::npos;
    }
  }
  metrics.source_lines_of_code =
      metrics.lines_of_code - metrics.blank_lines - metrics.comment_lines;
  return metrics;
}

void ApplyComplexities(CodeMetrics &metrics,
                       const std::vector<int> &complexities) {
  metrics.function_count = static_cast<int>(complexities.size());
  if (complexities.empty()) {
    metrics.cyclomatic_complexity = 0.0;
    metrics.max_complexity = 0;
    return;
  }
  const auto total = std::accumulate(complexities.begin(), complexities.end(), 0);
  metrics.cyclomatic_complexity =
      static_cast<double>(total) / static_cast<double>(complexities.size());
  metrics.max_complexity =
      *std::max_element(complexities.begin(), complexities.end());
}

} // namespace sage
