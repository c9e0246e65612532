#pragma once

#include <sage/logging.h>
#include <sage/models.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace sage {

struct RuleDefinition {
  std::string id;
  std::string name;
  std::string description;
  std::string pattern;
  Severity severity = Severity::kMedium;
  Category category = Category::kCodeSmell;
  std::vector<std::string> languages;
  std::string message;
  std::optional<std::string> fix_suggestion;
  bool auto_fixable = false;
  bool case_insensitive = false;
  // Matches only count when the Shannon entropy of capture group
  // `entropy_group` reaches `min_entropy` bits per character.
  std::optional<double> min_entropy;
  std::size_t entropy_group = 0;
  // Capture group whose span is reported as the issue's columns.
  std::size_t location_group = 0;
};

struct Rule {
  RuleDefinition definition;
  std::regex pattern;

  bool AppliesTo(const std::string &language) const;
};

class RuleCatalog {
public:
  explicit RuleCatalog(std::shared_ptr<Logger> logger = nullptr);

  // Returns false (and logs a warning) for a duplicate id or a pattern that
  // does not compile. Throws std::logic_error once frozen.
  bool AddRule(RuleDefinition definition);
  std::size_t AddRules(std::vector<RuleDefinition> definitions);

  void Freeze() { frozen_ = true; }
  bool frozen() const { return frozen_; }

  const std::vector<Rule> &Rules() const { return rules_; }
  std::vector<const Rule *> RulesFor(const std::string &language) const;
  const Rule *Find(const std::string &id) const;
  std::size_t size() const { return rules_.size(); }

private:
  std::vector<Rule> rules_;
  std::shared_ptr<Logger> logger_;
  bool frozen_ = false;
};

std::vector<RuleDefinition> BuiltinRuleDefinitions();

// Reads a `rules:` list from a YAML or JSON file. Bad entries are skipped
// and an unreadable file yields an empty list; both are logged.
std::vector<RuleDefinition>
LoadRuleDefinitions(const std::filesystem::path &path,
                    const std::shared_ptr<Logger> &logger);

std::vector<RuleDefinition>
WithoutCategory(std::vector<RuleDefinition> definitions, Category category);

double ShannonEntropy(const std::string &value);

} // namespace sage
