#include <sage/code_sage.h>

#include <sage/cli_exit_codes.h>
#include <sage/detector_registry.h>
#include <sage/enrichment.h>
#include <sage/errors.h>
#include <sage/file_discovery.h>
#include <sage/file_orchestrator.h>
#include <sage/json_reporter.h>
#include <sage/reporter_registry.h>
#include <sage/result_assembler.h>
#include <sage/rule_catalog.h>
#include <sage/source_reader.h>
#include <sage/taxonomy.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using sage::AnalyzeOptions;
using sage::ReportOptions;

void PrintAnalyzeUsage(std::ostream &out) {
  out << "Usage: code-sage analyze <path> [options]\n"
      << "Options:\n"
      << "  --config <file>          YAML or JSON config file (default:\n"
      << "                           .codesage.yaml in the working "
         "directory)\n"
      << "  --format <name>          console, json or sarif (default: "
         "console)\n"
      << "  --out <file>             Write the report to a file instead of\n"
      << "                           stdout\n"
      << "  --min-severity <level>   info, low, medium, high or critical\n"
      << "  --security/--no-security Toggle the security rules\n"
      << "  --ai/--no-ai             Toggle explanations for the top issues\n"
      << "  --rules <file>           Extra rule file; repeatable or "
         "comma-separated\n"
      << "  --workers <n>            Number of concurrent workers\n"
      << "  --sequential             Analyze files on the calling thread\n"
      << "  --log-level <level>      Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose                Shortcut for --log-level info\n"
      << "  --debug                  Shortcut for --log-level debug\n"
      << "  --help                   Show this message\n";
}

void PrintReportUsage(std::ostream &out) {
  out << "Usage: code-sage report <report.json> [options]\n"
      << "Options:\n"
      << "  --format <name>         console, json or sarif (default: "
         "console)\n"
      << "  --out <file>            Write the report to a file instead of "
         "stdout\n"
      << "  --min-severity <level>  Drop issues below this severity\n"
      << "  --help                  Show this message\n";
}

void PrintInitUsage(std::ostream &out) {
  out << "Usage: code-sage init [--out <file>]\n"
      << "Writes the default configuration (default: .codesage.yaml).\n";
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

std::string ValidateFormat(const std::string &format) {
  const auto &formats = sage::SupportedOutputFormats();
  if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
    throw std::invalid_argument("Unsupported format: " + format);
  }
  return format;
}

std::size_t ParseWorkerCount(const std::string &value) {
  const auto invalid = [&value] {
    return std::invalid_argument("--workers expects a positive integer, got '" +
                                 value + "'");
  };
  // std::stoul skips whitespace and wraps negative input.
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
    throw invalid();
  }
  std::size_t consumed = 0;
  unsigned long workers = 0;
  try {
    workers = std::stoul(value, &consumed);
  } catch (const std::exception &) {
    throw invalid();
  }
  if (consumed != value.size() || workers == 0) {
    throw invalid();
  }
  return static_cast<std::size_t>(workers);
}

bool HandleToggleOption(const std::string &argument, AnalyzeOptions &options) {
  if (argument == "--security") {
    options.enable_security = true;
  } else if (argument == "--no-security") {
    options.enable_security = false;
  } else if (argument == "--ai") {
    options.enable_ai = true;
  } else if (argument == "--no-ai") {
    options.enable_ai = false;
  } else if (argument == "--sequential") {
    options.parallel = false;
  } else {
    return false;
  }
  return true;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        sage::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = sage::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = sage::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--format") {
    options.format = ValidateFormat(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--out") {
    options.output_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--min-severity") {
    options.min_severity =
        sage::ParseSeverity(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--rules") {
    for (const auto &file : SplitList(RequireValue(arguments, index, argument))) {
      options.rule_files.emplace_back(file);
    }
    return true;
  }
  if (argument == "--workers") {
    options.workers = ParseWorkerCount(RequireValue(arguments, index, argument));
    return true;
  }
  if (HandleToggleOption(argument, options)) {
    return true;
  }
  if (HandleLoggingOption(arguments, index, options)) {
    return true;
  }
  if (argument.rfind('-', 0) != 0) {
    if (options.path) {
      throw std::invalid_argument("Unexpected argument: " + argument);
    }
    options.path = argument;
    return true;
  }
  return false;
}

void WriteOutput(const std::string &content,
                 const std::optional<std::filesystem::path> &output_file,
                 std::ostream &out) {
  if (!output_file) {
    out << content;
    return;
  }
  if (output_file->has_parent_path()) {
    std::filesystem::create_directories(output_file->parent_path());
  }
  std::ofstream stream(*output_file);
  if (!stream) {
    throw sage::FileAccessError("cannot open output file",
                                output_file->string());
  }
  stream << content;
  out << "Report written to " << output_file->string() << "\n";
}

std::vector<sage::RuleDefinition>
LoadCustomRules(const std::vector<std::filesystem::path> &files,
                const std::shared_ptr<sage::Logger> &logger) {
  std::vector<sage::RuleDefinition> rules;
  for (const auto &file : files) {
    auto loaded = sage::LoadRuleDefinitions(file, logger);
    rules.insert(rules.end(), std::make_move_iterator(loaded.begin()),
                 std::make_move_iterator(loaded.end()));
  }
  return rules;
}

} // namespace

namespace sage {

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

ReportOptions ParseReportArguments(const std::vector<std::string> &arguments) {
  ReportOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--format") {
      options.format = ValidateFormat(RequireValue(arguments, i, argument));
      continue;
    }
    if (argument == "--out") {
      options.output_file = RequireValue(arguments, i, argument);
      continue;
    }
    if (argument == "--min-severity") {
      options.min_severity = ParseSeverity(RequireValue(arguments, i, argument));
      continue;
    }
    if (argument.rfind('-', 0) != 0 && !options.input) {
      options.input = argument;
      continue;
    }
    throw std::invalid_argument("Unknown report argument: " + argument);
  }
  return options;
}

InitOptions ParseInitArguments(const std::vector<std::string> &arguments) {
  InitOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--out") {
      options.output = RequireValue(arguments, i, argument);
      continue;
    }
    throw std::invalid_argument("Unknown init argument: " + argument);
  }
  return options;
}

SageConfig MergeOptions(SageConfig config, const AnalyzeOptions &cli_options) {
  if (cli_options.format) {
    config.output.format = *cli_options.format;
  }
  if (cli_options.min_severity) {
    config.min_severity = *cli_options.min_severity;
  }
  if (cli_options.enable_security) {
    config.analysis.enable_security = *cli_options.enable_security;
  }
  if (cli_options.enable_ai) {
    config.ai.enabled = *cli_options.enable_ai;
  }
  if (cli_options.workers) {
    config.analysis.max_workers = *cli_options.workers;
  }
  if (cli_options.parallel) {
    config.analysis.parallel = *cli_options.parallel;
  }
  if (cli_options.log_level) {
    config.log_level = *cli_options.log_level;
  }
  config.custom_rules.insert(config.custom_rules.end(),
                             cli_options.rule_files.begin(),
                             cli_options.rule_files.end());
  return config;
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(out);
    return kExitClean;
  }
  if (!cli_options.path) {
    throw std::invalid_argument("analyze requires a <path> to analyze");
  }

  const auto config =
      MergeOptions(LoadConfig(cli_options.config_file,
                              std::filesystem::current_path()),
                   cli_options);
  auto logger = MakeLogger(LoggingConfig{config.log_level}, std::clog);
  if (config.source) {
    logger->Log(LogLevel::kInfo, "config.loaded",
                {{"path", config.source->string()}});
  }

  auto catalog = MakeRuleCatalog(
      config.analysis, LoadCustomRules(config.custom_rules, logger), logger);
  auto reader = std::make_shared<FileSourceReader>();
  auto registry = MakeDefaultDetectorRegistry(config.analysis, reader, logger);
  DiscoveryOptions discovery_options;
  discovery_options.include_patterns = config.include_patterns;
  discovery_options.ignore_patterns = config.ignore_patterns;
  auto discovery =
      std::make_shared<GlobFileDiscovery>(std::move(discovery_options), logger);

  FileOrchestrator orchestrator(config.analysis, std::move(registry),
                                std::move(catalog), discovery, reader, logger);
  if (config.ai.enabled) {
    orchestrator.SetEnricher(
        std::make_shared<CatalogEnricher>(orchestrator.catalog()),
        config.ai.max_issues);
  }

  auto result = orchestrator.AnalyzeProject(*cli_options.path);
  IssueFilter filter;
  filter.min_severity = config.min_severity;
  result = FilterResult(std::move(result), filter, orchestrator.aggregator());

  const auto reporter =
      MakeReporterRegistryWithDefaults().Create(config.output.format);
  WriteOutput(reporter->Render(result), cli_options.output_file, out);
  return AnalysisExitCode(result);
}

int RunReport(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseReportArguments(arguments);
  if (options.show_help) {
    PrintReportUsage(out);
    return kExitClean;
  }
  if (!options.input) {
    throw std::invalid_argument("report requires a JSON report to render");
  }

  auto result = LoadJsonReport(*options.input);
  if (options.min_severity) {
    IssueFilter filter;
    filter.min_severity = options.min_severity;
    result = FilterResult(std::move(result), filter, IssueAggregator());
  }
  const auto reporter =
      MakeReporterRegistryWithDefaults().Create(options.format.value_or(""));
  WriteOutput(reporter->Render(result), options.output_file, out);
  return kExitClean;
}

int RunInit(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseInitArguments(arguments);
  if (options.show_help) {
    PrintInitUsage(out);
    return kExitClean;
  }
  WriteDefaultConfig(options.output);
  out << "Created configuration file: " << options.output.string() << "\n";
  return kExitClean;
}

void PrintGlobalUsage(std::ostream &out) {
  out << "Usage: code-sage <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Analyze a file or directory (default command).\n"
      << "  report    Render a saved JSON report in another format.\n"
      << "  init      Write a default .codesage.yaml.\n\n"
      << "Run 'code-sage <command> --help' for command options.\n"
      << "Exit codes: 0 clean, 1 error, 2 critical issues found.\n";
}

} // namespace sage
