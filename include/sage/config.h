#pragma once

#include <sage/file_discovery.h>
#include <sage/logging.h>
#include <sage/models.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sage {

struct AiSettings {
  bool enabled = false;
  std::size_t max_issues = 10;
};

struct OutputSettings {
  std::string format = "console";
  std::filesystem::path directory = "reports";
};

struct SageConfig {
  AnalysisSettings analysis;
  Severity min_severity = Severity::kInfo;
  std::vector<std::filesystem::path> custom_rules;
  AiSettings ai;
  OutputSettings output;
  std::vector<std::string> include_patterns = DefaultIncludePatterns();
  std::vector<std::string> ignore_patterns = DefaultIgnorePatterns();
  LogLevel log_level = LogLevel::kWarn;
  // File the values were read from, if any.
  std::optional<std::filesystem::path> source;
};

const std::vector<std::string> &SupportedOutputFormats();

// Throws ConfigurationError for a missing or malformed file, an unknown key
// or an invalid value.
SageConfig LoadConfigFile(const std::filesystem::path &path);

// .codesage.yaml, .codesage.yml or .codesage.json inside `directory`.
std::optional<std::filesystem::path>
FindDefaultConfig(const std::filesystem::path &directory);

// Explicit file if given, else the default file in `search_directory`, else
// built-in defaults; environment overrides are applied last.
SageConfig LoadConfig(const std::optional<std::filesystem::path> &path,
                      const std::filesystem::path &search_directory);

// CODE_SAGE_MIN_SEVERITY replaces min_severity.
void ApplyEnvironmentOverrides(SageConfig &config);

std::string DefaultConfigYaml();

// Refuses to replace an existing file.
void WriteDefaultConfig(const std::filesystem::path &path);

} // namespace sage
