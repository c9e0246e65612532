#include <sage/sarif_reporter.h>

#include <sage/escaping.h>
#include <sage/issue_factory.h>
#include <sage/taxonomy.h>

#include <set>
#include <sstream>

namespace sage {
namespace {

constexpr const char kSchema[] =
    "https://json.schemastore.org/sarif-2.1.0.json";
constexpr const char kToolName[] = "code-sage";
constexpr const char kToolVersion[] = "0.1.0";

std::string RuleIdOf(const Issue &issue) {
  const auto id = CheckIdOf(issue);
  return id.empty() ? std::string("code-sage") : id;
}

std::string BuildRuleJson(const Issue &issue) {
  std::ostringstream json;
  json << "{\"id\": " << JsonString(RuleIdOf(issue)) << ", ";
  json << "\"shortDescription\": {\"text\": " << JsonString(issue.title)
       << "}, ";
  json << "\"defaultConfiguration\": {\"level\": "
       << JsonString(SarifLevel(issue.severity)) << "}, ";
  json << "\"properties\": {\"category\": "
       << JsonString(CategoryName(issue.category)) << "}}";
  return json.str();
}

std::string BuildRegionJson(const Location &location) {
  std::ostringstream json;
  json << "{\"startLine\": " << location.line_start
       << ", \"endLine\": " << location.line_end;
  if (location.column_start) {
    json << ", \"startColumn\": " << *location.column_start;
  }
  if (location.column_end) {
    // SARIF end columns are exclusive.
    json << ", \"endColumn\": " << *location.column_end + 1;
  }
  json << "}";
  return json.str();
}

std::string BuildResultJson(const Issue &issue) {
  std::ostringstream json;
  json << "{\"ruleId\": " << JsonString(RuleIdOf(issue)) << ", ";
  json << "\"level\": " << JsonString(SarifLevel(issue.severity)) << ", ";
  json << "\"message\": {\"text\": "
       << JsonString(issue.title + ": " + issue.description) << "}, ";
  json << "\"locations\": [{\"physicalLocation\": {\"artifactLocation\": "
          "{\"uri\": "
       << JsonString(issue.location.file_path) << "}, \"region\": "
       << BuildRegionJson(issue.location) << "}}], ";
  json << "\"partialFingerprints\": {\"codeSageIssueId\": "
       << JsonString(issue.id) << "}, ";
  json << "\"properties\": {\"severity\": "
       << JsonString(SeverityName(issue.severity)) << ", \"category\": "
       << JsonString(CategoryName(issue.category))
       << ", \"confidence\": " << FormatDouble(issue.confidence, 2)
       << ", \"autoFixable\": " << (issue.auto_fixable ? "true" : "false")
       << "}}";
  return json.str();
}

} // namespace

std::string SarifLevel(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
  case Severity::kHigh:
    return "error";
  case Severity::kMedium:
    return "warning";
  case Severity::kLow:
    return "note";
  case Severity::kInfo:
    return "none";
  }
  return "none";
}

std::string SarifReporter::Render(const ProjectResult &result) const {
  std::vector<std::string> rules;
  std::vector<std::string> results;
  std::set<std::string> seen_rules;
  for (const auto &file : result.files) {
    for (const auto &issue : file.issues) {
      if (seen_rules.insert(RuleIdOf(issue)).second) {
        rules.push_back(BuildRuleJson(issue));
      }
      results.push_back(BuildResultJson(issue));
    }
  }

  const auto join = [](const std::vector<std::string> &items) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
      joined += (i > 0 ? ",\n" : "") + items[i];
    }
    return joined;
  };

  std::ostringstream sarif;
  sarif << "{\"$schema\": " << JsonString(kSchema) << ", ";
  sarif << "\"version\": \"2.1.0\", ";
  sarif << "\"runs\": [{\"tool\": {\"driver\": {\"name\": "
        << JsonString(kToolName) << ", \"version\": "
        << JsonString(kToolVersion) << ", \"rules\": [" << join(rules)
        << "]}}, ";
  sarif << "\"results\": [" << join(results) << "]}]}\n";
  return sarif.str();
}

} // namespace sage
