#include <sage/pattern_detector.h>

#include <sage/issue_factory.h>

#include <regex>

namespace sage {
namespace {

bool PassesEntropyGate(const RuleDefinition &definition,
                       const std::smatch &match) {
  if (!definition.min_entropy) {
    return true;
  }
  const auto &group = match[definition.entropy_group];
  if (!group.matched) {
    return false;
  }
  return ShannonEntropy(group.str()) >= *definition.min_entropy;
}

Issue MakeRuleIssue(const std::string &file_path, const Rule &rule,
                    const std::vector<std::string> &lines, int line_number,
                    std::size_t offset, std::size_t length) {
  const auto &definition = rule.definition;
  auto issue = NewIssue(file_path, definition.id, line_number, line_number);
  issue.title = definition.name;
  issue.description =
      definition.message.empty() ? definition.description : definition.message;
  issue.severity = definition.severity;
  issue.category = definition.category;
  issue.location.column_start = static_cast<int>(offset) + 1;
  issue.location.column_end = static_cast<int>(offset + length);
  issue.code_snippet = FormatSnippet(lines, line_number, line_number);
  issue.suggested_fix = definition.fix_suggestion;
  issue.auto_fixable = definition.auto_fixable;
  issue.rule_id = definition.id;
  return issue;
}

} // namespace

PatternDetector::PatternDetector(const RuleCatalog &catalog)
    : catalog_(catalog) {}

std::vector<Issue> PatternDetector::MatchFile(const std::string &file_path,
                                              const std::string &content,
                                              const std::string &language) const {
  return MatchLines(file_path, SplitLines(content), language);
}

std::vector<Issue>
PatternDetector::MatchLines(const std::string &file_path,
                            const std::vector<std::string> &lines,
                            const std::string &language) const {
  std::vector<Issue> issues;
  for (const auto *rule : catalog_.RulesFor(language)) {
    for (std::size_t index = 0; index < lines.size(); ++index) {
      const auto &line = lines[index];
      const auto line_number = static_cast<int>(index) + 1;
      std::size_t position = 0;
      while (position <= line.size()) {
        std::smatch match;
        const auto begin = line.begin() + static_cast<std::ptrdiff_t>(position);
        const auto flags = position == 0 ? std::regex_constants::match_default
                                         : std::regex_constants::match_prev_avail;
        if (!std::regex_search(begin, line.end(), match, rule->pattern,
                               flags)) {
          break;
        }
        const auto offset = position + static_cast<std::size_t>(match.position(0));
        const auto length = static_cast<std::size_t>(match.length(0));
        if (PassesEntropyGate(rule->definition, match)) {
          auto group = rule->definition.location_group;
          if (!match[group].matched) {
            group = 0;
          }
          issues.push_back(MakeRuleIssue(
              file_path, *rule, lines, line_number,
              position + static_cast<std::size_t>(match.position(group)),
              static_cast<std::size_t>(match.length(group))));
        }
        position = offset + (length == 0 ? 1 : length);
      }
    }
  }
  return issues;
}

} // namespace sage
