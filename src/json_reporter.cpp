#include <sage/json_reporter.h>

#include <sage/aggregator.h>
#include <sage/errors.h>
#include <sage/escaping.h>
#include <sage/taxonomy.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace sage {
namespace {

std::string OptionalJson(const std::optional<std::string> &value) {
  return value ? JsonString(*value) : "null";
}

std::string OptionalJson(const std::optional<int> &value) {
  return value ? std::to_string(*value) : "null";
}

std::string BuildMetricsJson(const std::optional<CodeMetrics> &metrics) {
  if (!metrics) {
    return "null";
  }
  std::ostringstream json;
  json << "{\"lines_of_code\": " << metrics->lines_of_code << ", ";
  json << "\"source_lines_of_code\": " << metrics->source_lines_of_code
       << ", ";
  json << "\"comment_lines\": " << metrics->comment_lines << ", ";
  json << "\"blank_lines\": " << metrics->blank_lines << ", ";
  json << "\"function_count\": " << metrics->function_count << ", ";
  json << "\"cyclomatic_complexity\": "
       << FormatDouble(metrics->cyclomatic_complexity, 2) << ", ";
  json << "\"max_complexity\": " << metrics->max_complexity << "}";
  return json.str();
}

std::string BuildFileJson(const FileRecord &file) {
  std::ostringstream json;
  json << "{\"file_path\": " << JsonString(file.file_path) << ", ";
  json << "\"language\": " << JsonString(file.language) << ", ";
  json << "\"success\": " << (file.success ? "true" : "false") << ", ";
  json << "\"error\": " << OptionalJson(file.error) << ", ";
  json << "\"analysis_time\": " << FormatDouble(file.analysis_time, 4) << ", ";
  json << "\"metrics\": " << BuildMetricsJson(file.metrics) << ", ";
  json << "\"issues\": [";
  for (std::size_t i = 0; i < file.issues.size(); ++i) {
    if (i > 0) {
      json << ", ";
    }
    json << IssueToJson(file.issues[i]);
  }
  json << "]}";
  return json.str();
}

std::string BuildSummaryJson(const Summary &summary) {
  std::ostringstream json;
  json << "{\"total_issues\": " << summary.total_issues << ", ";
  json << "\"by_severity\": {";
  bool first = true;
  for (const auto &[severity, count] : summary.by_severity) {
    json << (first ? "" : ", ") << JsonString(SeverityName(severity)) << ": "
         << count;
    first = false;
  }
  json << "}, \"by_category\": {";
  first = true;
  for (const auto &[category, count] : summary.by_category) {
    json << (first ? "" : ", ") << JsonString(CategoryName(category)) << ": "
         << count;
    first = false;
  }
  json << "}, \"by_file\": [";
  for (std::size_t i = 0; i < summary.by_file.size(); ++i) {
    if (i > 0) {
      json << ", ";
    }
    json << "{\"file_path\": " << JsonString(summary.by_file[i].first)
         << ", \"issues\": " << summary.by_file[i].second << "}";
  }
  json << "], \"auto_fixable\": " << summary.auto_fixable << ", ";
  json << "\"high_priority\": " << summary.high_priority << ", ";
  json << "\"files_with_issues\": " << summary.files_with_issues << ", ";
  json << "\"files_without_issues\": " << summary.files_without_issues << "}";
  return json.str();
}

std::optional<std::string> ReadOptionalString(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  return node.as<std::string>();
}

std::optional<int> ReadOptionalInt(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  return node.as<int>();
}

Issue ReadIssue(const YAML::Node &node) {
  Issue issue;
  issue.id = node["id"].as<std::string>();
  issue.title = node["title"].as<std::string>();
  issue.description = node["description"].as<std::string>("");
  issue.severity = ParseSeverity(node["severity"].as<std::string>());
  issue.category = ParseCategory(node["category"].as<std::string>());
  const auto location = node["location"];
  issue.location.file_path = location["file_path"].as<std::string>();
  issue.location.line_start = location["line_start"].as<int>();
  issue.location.line_end = location["line_end"].as<int>();
  issue.location.column_start = ReadOptionalInt(location["column_start"]);
  issue.location.column_end = ReadOptionalInt(location["column_end"]);
  issue.code_snippet = ReadOptionalString(node["code_snippet"]);
  issue.suggested_fix = ReadOptionalString(node["suggested_fix"]);
  issue.fix_description = ReadOptionalString(node["fix_description"]);
  issue.ai_explanation = ReadOptionalString(node["ai_explanation"]);
  issue.confidence = node["confidence"].as<double>(1.0);
  issue.auto_fixable = node["auto_fixable"].as<bool>(false);
  issue.rule_id = ReadOptionalString(node["rule_id"]);
  if (const auto references = node["references"]; references &&
                                                   references.IsSequence()) {
    for (const auto &reference : references) {
      issue.references.push_back(reference.as<std::string>());
    }
  }
  if (const auto metadata = node["metadata"]; metadata && metadata.IsMap()) {
    for (const auto &entry : metadata) {
      issue.metadata[entry.first.as<std::string>()] =
          entry.second.as<std::string>();
    }
  }
  return issue;
}

std::optional<CodeMetrics> ReadMetrics(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  CodeMetrics metrics;
  metrics.lines_of_code = node["lines_of_code"].as<int>(0);
  metrics.source_lines_of_code = node["source_lines_of_code"].as<int>(0);
  metrics.comment_lines = node["comment_lines"].as<int>(0);
  metrics.blank_lines = node["blank_lines"].as<int>(0);
  metrics.function_count = node["function_count"].as<int>(0);
  metrics.cyclomatic_complexity = node["cyclomatic_complexity"].as<double>(0.0);
  metrics.max_complexity = node["max_complexity"].as<int>(0);
  return metrics;
}

FileRecord ReadFile(const YAML::Node &node) {
  FileRecord file;
  file.file_path = node["file_path"].as<std::string>();
  file.language = node["language"].as<std::string>("unknown");
  file.success = node["success"].as<bool>(true);
  file.error = ReadOptionalString(node["error"]);
  file.analysis_time = node["analysis_time"].as<double>(0.0);
  file.metrics = ReadMetrics(node["metrics"]);
  if (const auto issues = node["issues"]; issues && issues.IsSequence()) {
    for (const auto &issue : issues) {
      file.issues.push_back(ReadIssue(issue));
    }
  }
  return file;
}

} // namespace

std::string IssueToJson(const Issue &issue) {
  std::ostringstream json;
  json << "{\"id\": " << JsonString(issue.id) << ", ";
  json << "\"title\": " << JsonString(issue.title) << ", ";
  json << "\"description\": " << JsonString(issue.description) << ", ";
  json << "\"severity\": " << JsonString(SeverityName(issue.severity)) << ", ";
  json << "\"category\": " << JsonString(CategoryName(issue.category)) << ", ";
  json << "\"location\": {\"file_path\": "
       << JsonString(issue.location.file_path)
       << ", \"line_start\": " << issue.location.line_start
       << ", \"line_end\": " << issue.location.line_end
       << ", \"column_start\": " << OptionalJson(issue.location.column_start)
       << ", \"column_end\": " << OptionalJson(issue.location.column_end)
       << "}, ";
  json << "\"code_snippet\": " << OptionalJson(issue.code_snippet) << ", ";
  json << "\"suggested_fix\": " << OptionalJson(issue.suggested_fix) << ", ";
  json << "\"fix_description\": " << OptionalJson(issue.fix_description)
       << ", ";
  json << "\"ai_explanation\": " << OptionalJson(issue.ai_explanation) << ", ";
  json << "\"confidence\": " << FormatDouble(issue.confidence, 2) << ", ";
  json << "\"auto_fixable\": " << (issue.auto_fixable ? "true" : "false")
       << ", ";
  json << "\"rule_id\": " << OptionalJson(issue.rule_id) << ", ";
  json << "\"references\": " << JoinJsonArray(issue.references) << ", ";
  json << "\"metadata\": {";
  bool first = true;
  for (const auto &[key, value] : issue.metadata) {
    json << (first ? "" : ", ") << JsonString(key) << ": " << JsonString(value);
    first = false;
  }
  json << "}}";
  return json.str();
}

std::string JsonReporter::Render(const ProjectResult &result) const {
  std::ostringstream json;
  json << "{\"project_path\": " << JsonString(result.project_path) << ", ";
  json << "\"timestamp\": " << JsonString(result.timestamp) << ", ";
  json << "\"total_files\": " << result.total_files << ", ";
  json << "\"total_issues\": " << result.total_issues << ", ";
  json << "\"total_time\": " << FormatDouble(result.total_time, 4) << ", ";
  json << "\"languages\": {";
  bool first = true;
  for (const auto &[language, count] : result.languages) {
    json << (first ? "" : ", ") << JsonString(language) << ": " << count;
    first = false;
  }
  json << "}, ";
  json << "\"summary\": " << BuildSummaryJson(result.summary) << ", ";
  json << "\"files\": [";
  for (std::size_t i = 0; i < result.files.size(); ++i) {
    if (i > 0) {
      json << ",\n";
    }
    json << BuildFileJson(result.files[i]);
  }
  json << "]}\n";
  return json.str();
}

ProjectResult ParseJsonReport(const std::string &json) {
  try {
    const auto root = YAML::Load(json);
    if (!root.IsMap() || !root["files"] || !root["files"].IsSequence()) {
      throw SageError("Not a code-sage JSON report");
    }
    ProjectResult result;
    result.project_path = root["project_path"].as<std::string>("");
    result.timestamp = root["timestamp"].as<std::string>("");
    result.total_time = root["total_time"].as<double>(0.0);
    for (const auto &file : root["files"]) {
      result.files.push_back(ReadFile(file));
    }
    result.total_files = result.files.size();
    for (const auto &file : result.files) {
      ++result.languages[file.language];
      result.total_issues += file.issues.size();
    }
    result.summary = IssueAggregator().Summarize(result.files);
    return result;
  } catch (const YAML::Exception &error) {
    throw SageError(std::string("Malformed JSON report: ") + error.what());
  } catch (const std::invalid_argument &error) {
    throw SageError(std::string("Malformed JSON report: ") + error.what());
  }
}

ProjectResult LoadJsonReport(const std::filesystem::path &path) {
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw FileAccessError("report not found", path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw FileAccessError("cannot open report", path.string());
  }
  std::ostringstream content;
  content << stream.rdbuf();
  return ParseJsonReport(content.str());
}

} // namespace sage
