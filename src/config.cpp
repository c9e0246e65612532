#include <sage/config.h>

#include <sage/errors.h>
#include <sage/taxonomy.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace sage {
namespace {

const std::vector<std::string> kTopLevelKeys = {
    "analysis", "ai", "output", "include_patterns", "ignore_patterns",
    "log_level"};
const std::vector<std::string> kAnalysisKeys = {
    "max_complexity", "max_function_length",  "max_parameters",
    "parallel",       "max_workers",          "min_severity",
    "similarity_threshold", "enable_security", "custom_rules"};
const std::vector<std::string> kAiKeys = {"enabled", "max_issues"};
const std::vector<std::string> kOutputKeys = {"format", "directory"};

std::string NormalizeConfigKey(std::string key) {
  key.erase(key.begin(),
            std::find_if(key.begin(), key.end(), [](unsigned char ch) {
              return std::isspace(ch) == 0;
            }));
  key.erase(std::find_if(key.rbegin(), key.rend(),
                         [](unsigned char ch) { return std::isspace(ch) == 0; })
                .base(),
            key.end());
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  std::replace(key.begin(), key.end(), '-', '_');
  if (key == "parallel_analysis") {
    return "parallel";
  }
  if (key == "enable_security_scan") {
    return "enable_security";
  }
  if (key == "output_dir") {
    return "directory";
  }
  return key;
}

std::string JoinKeys(const std::vector<std::string> &keys) {
  std::string joined;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    joined += keys[i];
    if (i + 1 < keys.size()) {
      joined += ", ";
    }
  }
  return joined;
}

[[noreturn]] void ThrowUnknownKey(const std::string &section,
                                  const std::string &key,
                                  const std::vector<std::string> &supported) {
  const auto scope = section.empty() ? std::string() : section + ".";
  throw ConfigurationError("Unknown config key: " + scope + key +
                           ". Supported keys: " + JoinKeys(supported));
}

std::string NormalizeAndValidateKey(const std::string &section,
                                    const YAML::Node &key_node,
                                    const std::vector<std::string> &supported) {
  const auto raw = key_node.as<std::string>();
  const auto key = NormalizeConfigKey(raw);
  if (std::find(supported.begin(), supported.end(), key) == supported.end()) {
    ThrowUnknownKey(section, raw, supported);
  }
  return key;
}

template <typename T>
T ReadScalar(const YAML::Node &node, const std::string &key) {
  if (!node.IsScalar()) {
    throw ConfigurationError("Config key '" + key + "' must be a scalar value");
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception &) {
    throw ConfigurationError("Config key '" + key +
                             "' has an invalid value: " + node.Scalar());
  }
}

int ReadPositiveInt(const YAML::Node &node, const std::string &key) {
  const auto value = ReadScalar<int>(node, key);
  if (value < 1) {
    throw ConfigurationError("Config key '" + key +
                             "' must be a positive integer");
  }
  return value;
}

std::vector<std::string> ReadStringList(const YAML::Node &node,
                                        const std::string &key) {
  std::vector<std::string> values;
  if (node.IsNull()) {
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(node.Scalar());
    return values;
  }
  if (!node.IsSequence()) {
    throw ConfigurationError("Config key '" + key +
                             "' must be a string or list of strings");
  }
  for (const auto &child : node) {
    if (!child.IsScalar()) {
      throw ConfigurationError("Config key '" + key +
                               "' must be a list of strings");
    }
    values.push_back(child.Scalar());
  }
  return values;
}

template <typename Apply>
void ForEachEntry(const YAML::Node &section_node, const std::string &section,
                  const std::vector<std::string> &supported, Apply apply) {
  if (section_node.IsNull()) {
    return;
  }
  if (!section_node.IsMap()) {
    throw ConfigurationError("Config section '" + section +
                             "' must be a mapping");
  }
  for (const auto &entry : section_node) {
    const auto key = NormalizeAndValidateKey(section, entry.first, supported);
    apply(key, entry.second, section + "." + key);
  }
}

void ApplyAnalysisSection(const YAML::Node &node,
                          const std::filesystem::path &base,
                          SageConfig &config) {
  ForEachEntry(node, "analysis", kAnalysisKeys,
               [&](const std::string &key, const YAML::Node &value,
                   const std::string &name) {
                 auto &analysis = config.analysis;
                 if (key == "max_complexity") {
                   analysis.max_complexity = ReadPositiveInt(value, name);
                 } else if (key == "max_function_length") {
                   analysis.max_function_length = ReadPositiveInt(value, name);
                 } else if (key == "max_parameters") {
                   analysis.max_parameters = ReadPositiveInt(value, name);
                 } else if (key == "parallel") {
                   analysis.parallel = ReadScalar<bool>(value, name);
                 } else if (key == "max_workers") {
                   analysis.max_workers = static_cast<std::size_t>(
                       ReadPositiveInt(value, name));
                 } else if (key == "min_severity") {
                   try {
                     config.min_severity =
                         ParseSeverity(ReadScalar<std::string>(value, name));
                   } catch (const std::invalid_argument &error) {
                     throw ConfigurationError("Config key '" + name +
                                              "': " + error.what());
                   }
                 } else if (key == "similarity_threshold") {
                   const auto threshold = ReadScalar<double>(value, name);
                   if (threshold < 0.0 || threshold > 1.0) {
                     throw ConfigurationError("Config key '" + name +
                                              "' must lie between 0 and 1");
                   }
                   analysis.similarity_threshold = threshold;
                 } else if (key == "enable_security") {
                   analysis.enable_security = ReadScalar<bool>(value, name);
                 } else if (key == "custom_rules") {
                   config.custom_rules.clear();
                   for (const auto &entry : ReadStringList(value, name)) {
                     std::filesystem::path rules(entry);
                     config.custom_rules.push_back(
                         rules.is_absolute() ? rules : base / rules);
                   }
                 }
               });
}

void ApplyAiSection(const YAML::Node &node, SageConfig &config) {
  ForEachEntry(node, "ai", kAiKeys,
               [&](const std::string &key, const YAML::Node &value,
                   const std::string &name) {
                 if (key == "enabled") {
                   config.ai.enabled = ReadScalar<bool>(value, name);
                 } else if (key == "max_issues") {
                   const auto limit = ReadScalar<int>(value, name);
                   if (limit < 0) {
                     throw ConfigurationError("Config key '" + name +
                                              "' must not be negative");
                   }
                   config.ai.max_issues = static_cast<std::size_t>(limit);
                 }
               });
}

void ApplyOutputSection(const YAML::Node &node, SageConfig &config) {
  ForEachEntry(node, "output", kOutputKeys,
               [&](const std::string &key, const YAML::Node &value,
                   const std::string &name) {
                 if (key == "format") {
                   const auto format = ReadScalar<std::string>(value, name);
                   const auto &formats = SupportedOutputFormats();
                   if (std::find(formats.begin(), formats.end(), format) ==
                       formats.end()) {
                     throw ConfigurationError("Config key '" + name +
                                              "' must be one of: " +
                                              JoinKeys(formats));
                   }
                   config.output.format = format;
                 } else if (key == "directory") {
                   config.output.directory =
                       ReadScalar<std::string>(value, name);
                 }
               });
}

} // namespace

const std::vector<std::string> &SupportedOutputFormats() {
  static const std::vector<std::string> kFormats = {"console", "json",
                                                    "sarif"};
  return kFormats;
}

SageConfig LoadConfigFile(const std::filesystem::path &path) {
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw ConfigurationError("Config file not found: " + path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &exception) {
    throw ConfigurationError("Cannot parse config file " + path.string() +
                             ": " + exception.what());
  }

  SageConfig config;
  config.source = path;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigurationError("Config file must contain a mapping at the root");
  }

  const auto base = path.parent_path();
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey("", entry.first, kTopLevelKeys);
    const auto &value = entry.second;
    if (key == "analysis") {
      ApplyAnalysisSection(value, base, config);
    } else if (key == "ai") {
      ApplyAiSection(value, config);
    } else if (key == "output") {
      ApplyOutputSection(value, config);
    } else if (key == "include_patterns") {
      config.include_patterns = ReadStringList(value, key);
    } else if (key == "ignore_patterns") {
      config.ignore_patterns = ReadStringList(value, key);
    } else if (key == "log_level") {
      try {
        config.log_level = ParseLogLevel(ReadScalar<std::string>(value, key));
      } catch (const std::invalid_argument &exception) {
        throw ConfigurationError("Config key 'log_level': " +
                                 std::string(exception.what()));
      }
    }
  }
  return config;
}

std::optional<std::filesystem::path>
FindDefaultConfig(const std::filesystem::path &directory) {
  for (const auto *name : {".codesage.yaml", ".codesage.yml", ".codesage.json"}) {
    const auto candidate = directory / name;
    std::error_code error;
    if (std::filesystem::is_regular_file(candidate, error)) {
      return candidate;
    }
  }
  return std::nullopt;
}

SageConfig LoadConfig(const std::optional<std::filesystem::path> &path,
                      const std::filesystem::path &search_directory) {
  SageConfig config;
  if (path) {
    config = LoadConfigFile(*path);
  } else if (const auto found = FindDefaultConfig(search_directory)) {
    config = LoadConfigFile(*found);
  }
  ApplyEnvironmentOverrides(config);
  return config;
}

void ApplyEnvironmentOverrides(SageConfig &config) {
  const char *value = std::getenv("CODE_SAGE_MIN_SEVERITY");
  if (value == nullptr || *value == '\0') {
    return;
  }
  try {
    config.min_severity = ParseSeverity(value);
  } catch (const std::invalid_argument &error) {
    throw ConfigurationError(std::string("CODE_SAGE_MIN_SEVERITY: ") +
                             error.what());
  }
}

std::string DefaultConfigYaml() {
  const SageConfig defaults;
  YAML::Emitter out;
  out.SetDoublePrecision(3);
  out << YAML::BeginMap;

  out << YAML::Key << "analysis" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "max_complexity" << YAML::Value
      << defaults.analysis.max_complexity;
  out << YAML::Key << "max_function_length" << YAML::Value
      << defaults.analysis.max_function_length;
  out << YAML::Key << "max_parameters" << YAML::Value
      << defaults.analysis.max_parameters;
  out << YAML::Key << "parallel" << YAML::Value << defaults.analysis.parallel;
  out << YAML::Key << "max_workers" << YAML::Value
      << defaults.analysis.max_workers;
  out << YAML::Key << "min_severity" << YAML::Value
      << SeverityName(defaults.min_severity);
  out << YAML::Key << "similarity_threshold" << YAML::Value
      << defaults.analysis.similarity_threshold;
  out << YAML::Key << "enable_security" << YAML::Value
      << defaults.analysis.enable_security;
  out << YAML::Key << "custom_rules" << YAML::Value << YAML::Flow
      << YAML::BeginSeq << YAML::EndSeq;
  out << YAML::EndMap;

  out << YAML::Key << "ai" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << defaults.ai.enabled;
  out << YAML::Key << "max_issues" << YAML::Value << defaults.ai.max_issues;
  out << YAML::EndMap;

  out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "format" << YAML::Value << defaults.output.format;
  out << YAML::Key << "directory" << YAML::Value
      << defaults.output.directory.string();
  out << YAML::EndMap;

  out << YAML::Key << "include_patterns" << YAML::Value
      << defaults.include_patterns;
  out << YAML::Key << "ignore_patterns" << YAML::Value
      << defaults.ignore_patterns;
  out << YAML::Key << "log_level" << YAML::Value
      << LogLevelName(defaults.log_level);

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

void WriteDefaultConfig(const std::filesystem::path &path) {
  std::error_code error;
  if (std::filesystem::exists(path, error)) {
    throw ConfigurationError("Config file already exists: " + path.string());
  }
  std::ofstream stream(path);
  if (!stream) {
    throw FileAccessError("cannot create config file", path.string());
  }
  stream << DefaultConfigYaml();
}

} // namespace sage
