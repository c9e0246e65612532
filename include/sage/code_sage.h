#pragma once

#include <sage/config.h>
#include <sage/logging.h>
#include <sage/models.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sage {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> path;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> format;
  std::optional<std::filesystem::path> output_file;
  std::optional<Severity> min_severity;
  std::optional<bool> enable_security;
  std::optional<bool> enable_ai;
  std::vector<std::filesystem::path> rule_files;
  std::optional<std::size_t> workers;
  std::optional<bool> parallel;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct ReportOptions {
  std::optional<std::filesystem::path> input;
  std::optional<std::string> format;
  std::optional<std::filesystem::path> output_file;
  std::optional<Severity> min_severity;
  bool show_help = false;
};

struct InitOptions {
  std::filesystem::path output = ".codesage.yaml";
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
ReportOptions ParseReportArguments(const std::vector<std::string> &arguments);
InitOptions ParseInitArguments(const std::vector<std::string> &arguments);

// Command-line values win over the configuration file.
SageConfig MergeOptions(SageConfig config, const AnalyzeOptions &cli_options);

// Each returns the process exit code; fatal errors propagate as exceptions.
int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out);
int RunReport(const std::vector<std::string> &arguments, std::ostream &out);
int RunInit(const std::vector<std::string> &arguments, std::ostream &out);

void PrintGlobalUsage(std::ostream &out);

} // namespace sage
