#include <sage/lexical_detector.h>

#include <sage/code_metrics.h>
#include <sage/errors.h>
#include <sage/issue_factory.h>
#include <sage/pattern_detector.h>
#include <sage/source_reader.h>

#include <algorithm>
#include <utility>

namespace sage {

std::string MaskLineComment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const auto character = line[i];
    if (quote != '\0') {
      if (character == '\\') {
        ++i;
      } else if (character == quote) {
        quote = '\0';
      }
      continue;
    }
    if (character == '"' || character == '\'' || character == '`') {
      quote = character;
      continue;
    }
    if (character == '/' && i + 1 < line.size() && line[i + 1] == '/') {
      auto masked = line;
      std::fill(masked.begin() + static_cast<std::ptrdiff_t>(i), masked.end(),
                ' ');
      return masked;
    }
  }
  return line;
}

std::vector<RuleDefinition> LexicalRuleDefinitions(const std::string &language) {
  const std::vector<std::string> languages = {language};
  return {
      {.id = "console-log",
       .name = "Console Logging Statement",
       .description = "console output left in source",
       .pattern = R"(\bconsole\.(log|debug|info|trace)\s*\()",
       .severity = Severity::kLow,
       .category = Category::kBestPractice,
       .languages = languages,
       .message = "console logging call. Use a logger or remove it before "
                  "shipping.",
       .fix_suggestion = "Remove the console call",
       .auto_fixable = true},
      {.id = "loose-equality",
       .name = "Loose Equality Comparison",
       .description = "== or != performs type coercion",
       .pattern = R"((^|[^=!])([=!]=)(?!=))",
       .severity = Severity::kMedium,
       .category = Category::kBestPractice,
       .languages = languages,
       .message = "Loose equality coerces operand types. Use === or !== "
                  "instead.",
       .fix_suggestion = "Replace == with === and != with !==",
       .auto_fixable = true,
       .location_group = 2},
      {.id = "var-usage",
       .name = "Use of var",
       .description = "function-scoped var declaration",
       .pattern = R"(\bvar\s+[A-Za-z_$])",
       .severity = Severity::kLow,
       .category = Category::kBestPractice,
       .languages = languages,
       .message = "'var' is function scoped. Prefer 'let' or 'const'.",
       .fix_suggestion = "Replace var with let or const",
       .auto_fixable = true},
      {.id = "eval-usage",
       .name = "Use of eval",
       .description = "eval executes arbitrary strings as code",
       .pattern = R"(\beval\s*\()",
       .severity = Severity::kHigh,
       .category = Category::kSecurity,
       .languages = languages,
       .message = "eval() executes arbitrary code and enables injection "
                  "attacks.",
       .fix_suggestion = "Parse data with JSON.parse or restructure the code"},
  };
}

LexicalDetector::LexicalDetector(std::string language,
                                 std::vector<std::string> extensions,
                                 std::vector<RuleDefinition> rules,
                                 std::shared_ptr<const SourceReader> reader,
                                 std::shared_ptr<Logger> logger)
    : language_(std::move(language)), extensions_(std::move(extensions)),
      reader_(std::move(reader)), logger_(EnsureLogger(std::move(logger))),
      catalog_(logger_) {
  if (!reader_) {
    reader_ = std::make_shared<FileSourceReader>();
  }
  catalog_.AddRules(std::move(rules));
  catalog_.Freeze();
}

bool LexicalDetector::CanAnalyze(const std::filesystem::path &path) const {
  const auto extension = path.extension().string();
  return std::find(extensions_.begin(), extensions_.end(), extension) !=
         extensions_.end();
}

FileRecord LexicalDetector::Analyze(const std::filesystem::path &path) const {
  std::string content;
  try {
    content = reader_->Read(path);
  } catch (const FileAccessError &error) {
    logger_->Log(LogLevel::kWarn, "detector.read_failed",
                 {{"path", path.string()}, {"error", error.what()}});
    return MakeFailedRecord(path.string(), Language(), error.what());
  }
  return AnalyzeSource(path.string(), content);
}

FileRecord LexicalDetector::AnalyzeSource(const std::string &file_path,
                                          const std::string &content) const {
  const auto lines = SplitLines(content);
  std::vector<std::string> masked;
  masked.reserve(lines.size());
  for (const auto &line : lines) {
    masked.push_back(MaskLineComment(line));
  }

  FileRecord record;
  record.file_path = file_path;
  record.language = Language();
  record.issues = PatternDetector(catalog_).MatchLines(file_path, masked,
                                                       Language());
  // Snippets show the source as written, not the masked copy.
  for (auto &issue : record.issues) {
    issue.code_snippet = FormatSnippet(lines, issue.location.line_start,
                                       issue.location.line_end);
  }
  record.metrics = CountLines(lines, CommentStyle::kCFamily);

  logger_->Log(LogLevel::kDebug, "lexical.analyzed",
               {{"path", file_path},
                {"language", Language()},
                {"issues", std::to_string(record.issues.size())}});
  return record;
}

std::unique_ptr<Detector>
MakeJavaScriptDetector(std::shared_ptr<const SourceReader> reader,
                       std::shared_ptr<Logger> logger) {
  return std::make_unique<LexicalDetector>(
      "javascript",
      std::vector<std::string>{".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx"},
      LexicalRuleDefinitions("javascript"), std::move(reader),
      std::move(logger));
}

std::unique_ptr<Detector>
MakeTypeScriptDetector(std::shared_ptr<const SourceReader> reader,
                       std::shared_ptr<Logger> logger) {
  return std::make_unique<LexicalDetector>(
      "typescript", std::vector<std::string>{".ts", ".tsx"},
      LexicalRuleDefinitions("typescript"), std::move(reader),
      std::move(logger));
}

} // namespace sage
