#include <sage/rule_catalog.h>

#include <sage/taxonomy.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace sage {
namespace {

const std::vector<std::string> kScriptLanguages = {"python", "javascript",
                                                   "typescript", "java"};
const std::vector<std::string> kCommentLanguages = {
    "python", "javascript", "typescript", "java", "go", "rust", "c", "cpp"};
const std::vector<std::string> kSecretLanguages = {
    "python", "javascript", "typescript", "java", "go",
    "ruby",   "php",        "rust",       "c",    "cpp"};
const std::vector<std::string> kWebLanguages = {"javascript", "typescript"};

std::string RequireString(const YAML::Node &entry, const std::string &key) {
  const auto node = entry[key];
  if (!node || !node.IsScalar() || node.as<std::string>().empty()) {
    throw std::invalid_argument("missing required field '" + key + "'");
  }
  return node.as<std::string>();
}

std::string OptionalString(const YAML::Node &entry, const std::string &key,
                           const std::string &fallback) {
  const auto node = entry[key];
  if (!node || node.IsNull()) {
    return fallback;
  }
  if (!node.IsScalar()) {
    throw std::invalid_argument("field '" + key + "' must be a string");
  }
  return node.as<std::string>();
}

bool OptionalBool(const YAML::Node &entry, const std::string &key) {
  const auto node = entry[key];
  if (!node || node.IsNull()) {
    return false;
  }
  return node.as<bool>();
}

std::vector<std::string> ExtractLanguages(const YAML::Node &entry) {
  std::vector<std::string> languages;
  const auto node = entry["languages"];
  if (!node || node.IsNull()) {
    return languages;
  }
  if (node.IsScalar()) {
    languages.push_back(node.as<std::string>());
    return languages;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("field 'languages' must be a list of strings");
  }
  for (const auto &child : node) {
    languages.push_back(child.as<std::string>());
  }
  return languages;
}

RuleDefinition ParseRuleEntry(const YAML::Node &entry) {
  if (!entry.IsMap()) {
    throw std::invalid_argument("rule entry must be a mapping");
  }
  RuleDefinition definition;
  definition.id = RequireString(entry, "id");
  definition.name = RequireString(entry, "name");
  definition.pattern = RequireString(entry, "pattern");
  definition.description = OptionalString(entry, "description", "");
  definition.severity =
      ParseSeverity(OptionalString(entry, "severity", "medium"));
  definition.category =
      ParseCategory(OptionalString(entry, "category", "code_smell"));
  definition.languages = ExtractLanguages(entry);
  definition.message =
      OptionalString(entry, "message", definition.description);
  if (const auto fix = OptionalString(entry, "fix_suggestion", "");
      !fix.empty()) {
    definition.fix_suggestion = fix;
  }
  definition.auto_fixable = OptionalBool(entry, "auto_fixable");
  definition.case_insensitive = OptionalBool(entry, "case_insensitive");
  if (const auto entropy = entry["min_entropy"]; entropy && !entropy.IsNull()) {
    definition.min_entropy = entropy.as<double>();
    if (const auto group = entry["entropy_group"]; group && !group.IsNull()) {
      definition.entropy_group = group.as<std::size_t>();
    }
  }
  if (const auto group = entry["location_group"]; group && !group.IsNull()) {
    definition.location_group = group.as<std::size_t>();
  }
  return definition;
}

} // namespace

bool Rule::AppliesTo(const std::string &language) const {
  const auto &languages = definition.languages;
  return std::find(languages.begin(), languages.end(), language) !=
         languages.end();
}

RuleCatalog::RuleCatalog(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

bool RuleCatalog::AddRule(RuleDefinition definition) {
  if (frozen_) {
    throw std::logic_error("Rule catalog is frozen; cannot add rule " +
                           definition.id);
  }
  if (Find(definition.id) != nullptr) {
    logger_->Log(LogLevel::kWarn, "catalog.rule.skipped",
                 {{"rule", definition.id}, {"reason", "duplicate id"}});
    return false;
  }

  auto flags = std::regex::ECMAScript;
  if (definition.case_insensitive) {
    flags |= std::regex::icase;
  }
  std::regex compiled;
  try {
    compiled = std::regex(definition.pattern, flags);
  } catch (const std::regex_error &error) {
    logger_->Log(LogLevel::kWarn, "catalog.rule.skipped",
                 {{"rule", definition.id},
                  {"reason", std::string("invalid pattern: ") + error.what()}});
    return false;
  }
  if (definition.min_entropy && definition.entropy_group > compiled.mark_count()) {
    logger_->Log(LogLevel::kWarn, "catalog.rule.skipped",
                 {{"rule", definition.id},
                  {"reason", "entropy group out of range"}});
    return false;
  }
  if (definition.location_group > compiled.mark_count()) {
    logger_->Log(LogLevel::kWarn, "catalog.rule.skipped",
                 {{"rule", definition.id},
                  {"reason", "location group out of range"}});
    return false;
  }

  logger_->Log(LogLevel::kDebug, "catalog.rule.added",
               {{"rule", definition.id}});
  rules_.push_back(Rule{std::move(definition), std::move(compiled)});
  return true;
}

std::size_t RuleCatalog::AddRules(std::vector<RuleDefinition> definitions) {
  std::size_t added = 0;
  for (auto &definition : definitions) {
    if (AddRule(std::move(definition))) {
      ++added;
    }
  }
  return added;
}

std::vector<const Rule *>
RuleCatalog::RulesFor(const std::string &language) const {
  std::vector<const Rule *> applicable;
  for (const auto &rule : rules_) {
    if (rule.AppliesTo(language)) {
      applicable.push_back(&rule);
    }
  }
  return applicable;
}

const Rule *RuleCatalog::Find(const std::string &id) const {
  const auto found =
      std::find_if(rules_.begin(), rules_.end(),
                   [&](const Rule &rule) { return rule.definition.id == id; });
  return found == rules_.end() ? nullptr : &*found;
}

std::vector<RuleDefinition> BuiltinRuleDefinitions() {
  return {
      {.id = "hardcoded-password",
       .name = "Hardcoded Password",
       .description = "Potential hardcoded password detected",
       .pattern = R"((password|passwd|pwd)\s*=\s*["'][^"']+["'])",
       .severity = Severity::kCritical,
       .category = Category::kSecurity,
       .languages = kScriptLanguages,
       .message = "Hardcoded password detected. Use environment variables "
                  "or secrets management.",
       .fix_suggestion = "Store passwords in environment variables or use a "
                         "secrets management service",
       .case_insensitive = true},
      {.id = "hardcoded-api-key",
       .name = "Hardcoded API Key",
       .description = "Potential hardcoded API key detected",
       .pattern =
           R"((api[_-]?key|apikey|access[_-]?key)\s*=\s*["'][A-Za-z0-9]{20,}["'])",
       .severity = Severity::kCritical,
       .category = Category::kSecurity,
       .languages = {"python", "javascript", "typescript", "java", "go"},
       .message = "Hardcoded API key detected",
       .fix_suggestion = "Use environment variables or a secrets manager",
       .case_insensitive = true},
      {.id = "sql-string-concat",
       .name = "SQL String Concatenation",
       .description = "SQL query built with string concatenation",
       .pattern = R"((SELECT|INSERT|UPDATE|DELETE).*\+.*["'])",
       .severity = Severity::kHigh,
       .category = Category::kSecurity,
       .languages = {"python", "javascript", "typescript", "java", "php"},
       .message = "SQL injection vulnerability: Use parameterized queries",
       .fix_suggestion = "Use parameterized queries or an ORM",
       .case_insensitive = true},
      {.id = "debug-print",
       .name = "Debug Print Statement",
       .description = "Debug print statement found",
       .pattern = R"((print|console\.log|System\.out\.println)\()",
       .severity = Severity::kLow,
       .category = Category::kCodeSmell,
       .languages = kScriptLanguages,
       .message = "Debug print statement should be removed or replaced with "
                  "proper logging",
       .fix_suggestion = "Use a logging library instead of print statements",
       .auto_fixable = true},
      {.id = "todo-comment",
       .name = "TODO Comment",
       .description = "TODO comment found",
       .pattern = R"(#\s*TODO|//\s*TODO|/\*\s*TODO)",
       .severity = Severity::kInfo,
       .category = Category::kMaintainability,
       .languages = kCommentLanguages,
       .message = "TODO comment found - consider creating a task or issue",
       .case_insensitive = true},
      {.id = "fixme-comment",
       .name = "FIXME Comment",
       .description = "FIXME comment found",
       .pattern = R"(#\s*FIXME|//\s*FIXME|/\*\s*FIXME)",
       .severity = Severity::kMedium,
       .category = Category::kBug,
       .languages = kCommentLanguages,
       .message = "FIXME comment indicates a known issue that needs attention",
       .case_insensitive = true},
      {.id = "except-pass",
       .name = "Empty Exception Handler",
       .description = "Exception caught but not handled",
       .pattern = R"(except.*:\s*pass)",
       .severity = Severity::kMedium,
       .category = Category::kBestPractice,
       .languages = {"python"},
       .message = "Empty exception handler - at least log the error",
       .fix_suggestion = "Add logging or proper error handling"},
      {.id = "catch-empty",
       .name = "Empty Catch Block",
       .description = "Exception caught but not handled",
       .pattern = R"(catch\s*\([^)]+\)\s*\{\s*\})",
       .severity = Severity::kMedium,
       .category = Category::kBestPractice,
       .languages = {"javascript", "typescript", "java"},
       .message = "Empty catch block - at least log the error",
       .fix_suggestion = "Add logging or proper error handling"},
      {.id = "aws-access-key",
       .name = "Hardcoded Secret: AWS Access Key",
       .description = "Potential hardcoded AWS access key detected",
       .pattern = R"(aws_access_key_id\s*=\s*["']?([A-Z0-9]{20})["']?)",
       .severity = Severity::kCritical,
       .category = Category::kSecurity,
       .languages = kSecretLanguages,
       .message = "Potential hardcoded AWS access key detected",
       .fix_suggestion = "Store secrets in environment variables or use a "
                         "secrets management service",
       .case_insensitive = true,
       .min_entropy = 3.0,
       .entropy_group = 1},
      {.id = "github-token",
       .name = "Hardcoded Secret: GitHub Token",
       .description = "Potential hardcoded GitHub token detected",
       .pattern = R"(github_token\s*=\s*["']?(ghp_[A-Za-z0-9]{36})["']?)",
       .severity = Severity::kCritical,
       .category = Category::kSecurity,
       .languages = kSecretLanguages,
       .message = "Potential hardcoded GitHub token detected",
       .fix_suggestion = "Store secrets in environment variables or use a "
                         "secrets management service",
       .case_insensitive = true,
       .min_entropy = 3.5,
       .entropy_group = 1},
      {.id = "private-key-block",
       .name = "Hardcoded Secret: Private Key",
       .description = "Private key material embedded in source",
       .pattern = R"(-----BEGIN\s+(RSA\s+|EC\s+|OPENSSH\s+)?PRIVATE\s+KEY-----)",
       .severity = Severity::kCritical,
       .category = Category::kSecurity,
       .languages = kSecretLanguages,
       .message = "Private key material embedded in source",
       .fix_suggestion = "Load keys from a protected file or a secrets "
                         "manager at runtime"},
      {.id = "shell-injection",
       .name = "Shell Command Injection Risk",
       .description = "Subprocess invoked through the shell",
       .pattern =
           R"((os\.system|os\.popen|subprocess\.(call|run|Popen))\s*\(.*shell\s*=\s*True)",
       .severity = Severity::kHigh,
       .category = Category::kSecurity,
       .languages = {"python"},
       .message = "Command executed through the shell; arguments may be "
                  "injected",
       .fix_suggestion = "Pass an argument list and keep shell=False"},
      {.id = "unsafe-pickle",
       .name = "Unsafe Pickle Deserialization",
       .description = "pickle can execute arbitrary code while loading",
       .pattern = R"(pickle\.loads?\()",
       .severity = Severity::kHigh,
       .category = Category::kSecurity,
       .languages = {"python"},
       .message = "Unpickling untrusted data can execute arbitrary code",
       .fix_suggestion = "Use a data-only format such as JSON"},
      {.id = "unsafe-yaml-load",
       .name = "Unsafe YAML Deserialization",
       .description = "yaml.load without an explicit safe loader",
       .pattern = R"(yaml\.load\([^,)]*\))",
       .severity = Severity::kHigh,
       .category = Category::kSecurity,
       .languages = {"python"},
       .message = "yaml.load without a loader can construct arbitrary objects",
       .fix_suggestion = "Use yaml.safe_load",
       .auto_fixable = true},
      {.id = "weak-random",
       .name = "Weak Random Number Generation",
       .description = "random.random() is not suitable for security purposes",
       .pattern = R"(random\.random\(\))",
       .severity = Severity::kMedium,
       .category = Category::kSecurity,
       .languages = {"python"},
       .message = "random.random() is predictable; use the secrets module "
                  "for tokens",
       .fix_suggestion = "Use secrets.token_hex or secrets.SystemRandom"},
      {.id = "document-write",
       .name = "Potential XSS via document.write",
       .description = "document.write inserts unescaped markup",
       .pattern = R"(document\.write\s*\()",
       .severity = Severity::kMedium,
       .category = Category::kSecurity,
       .languages = kWebLanguages,
       .message = "document.write inserts unescaped markup into the page",
       .fix_suggestion = "Build DOM nodes and set textContent instead"},
      {.id = "dangerous-inner-html",
       .name = "Potential XSS via innerHTML",
       .description = "Raw HTML assigned to the DOM",
       .pattern = R"(dangerouslySetInnerHTML|\.innerHTML\s*=)",
       .severity = Severity::kHigh,
       .category = Category::kSecurity,
       .languages = kWebLanguages,
       .message = "Assigning raw HTML can introduce cross-site scripting",
       .fix_suggestion = "Sanitize the markup or set textContent"},
  };
}

std::vector<RuleDefinition>
LoadRuleDefinitions(const std::filesystem::path &path,
                    const std::shared_ptr<Logger> &logger) {
  const auto log = EnsureLogger(logger);
  std::vector<RuleDefinition> definitions;

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    log->Log(LogLevel::kError, "catalog.rules.load_failed",
             {{"path", path.string()}, {"error", error.what()}});
    return definitions;
  }

  const auto rules = root.IsMap() ? root["rules"] : YAML::Node();
  if (!rules || !rules.IsSequence()) {
    log->Log(LogLevel::kError, "catalog.rules.load_failed",
             {{"path", path.string()},
              {"error", "expected a top-level 'rules' list"}});
    return definitions;
  }

  std::size_t index = 0;
  for (const auto &entry : rules) {
    try {
      definitions.push_back(ParseRuleEntry(entry));
    } catch (const YAML::Exception &error) {
      log->Log(LogLevel::kWarn, "catalog.rule.skipped",
               {{"path", path.string()},
                {"index", std::to_string(index)},
                {"reason", error.what()}});
    } catch (const std::invalid_argument &error) {
      log->Log(LogLevel::kWarn, "catalog.rule.skipped",
               {{"path", path.string()},
                {"index", std::to_string(index)},
                {"reason", error.what()}});
    }
    ++index;
  }

  log->Log(LogLevel::kInfo, "catalog.rules.loaded",
           {{"path", path.string()},
            {"count", std::to_string(definitions.size())}});
  return definitions;
}

std::vector<RuleDefinition>
WithoutCategory(std::vector<RuleDefinition> definitions, Category category) {
  definitions.erase(std::remove_if(definitions.begin(), definitions.end(),
                                   [&](const RuleDefinition &definition) {
                                     return definition.category == category;
                                   }),
                    definitions.end());
  return definitions;
}

double ShannonEntropy(const std::string &value) {
  if (value.empty()) {
    return 0.0;
  }
  std::map<char, std::size_t> counts;
  for (const auto character : value) {
    ++counts[character];
  }
  const auto length = static_cast<double>(value.size());
  double entropy = 0.0;
  for (const auto &[character, count] : counts) {
    const auto probability = static_cast<double>(count) / length;
    entropy -= probability * std::log2(probability);
  }
  return entropy;
}

} // namespace sage
