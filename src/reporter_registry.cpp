#include <sage/reporter_registry.h>

#include <sage/console_reporter.h>
#include <sage/json_reporter.h>
#include <sage/sarif_reporter.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sage {

void ReporterRegistry::Register(const std::string &name,
                                ReporterFactory factory, bool set_as_default) {
  if (name.empty()) {
    throw std::invalid_argument("Reporter name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (factories_.count(name) != 0) {
    throw std::invalid_argument("Reporter with name '" + name +
                                "' already registered");
  }
  factories_.emplace(name, std::move(factory));
  if (set_as_default || default_name_.empty()) {
    default_name_ = name;
  }
}

std::unique_ptr<Reporter>
ReporterRegistry::Create(const std::string &name) const {
  const auto target_name = name.empty() ? default_name_ : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default reporter registered");
  }
  const auto found = factories_.find(target_name);
  if (found == factories_.end()) {
    throw std::invalid_argument("Unknown reporter '" + target_name +
                                "'. Registered: " + JoinNames());
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for reporter '" + target_name +
                             "' returned null");
  }
  return instance;
}

bool ReporterRegistry::Contains(const std::string &name) const {
  return factories_.count(name) != 0;
}

std::vector<std::string> ReporterRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &entry : factories_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string ReporterRegistry::JoinNames() const {
  const auto names = Names();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

ReporterRegistry MakeReporterRegistryWithDefaults() {
  ReporterRegistry registry;
  registry.Register(
      "console", []() { return std::make_unique<ConsoleReporter>(); }, true);
  registry.Register("json", []() { return std::make_unique<JsonReporter>(); });
  registry.Register("sarif",
                    []() { return std::make_unique<SarifReporter>(); });
  return registry;
}

} // namespace sage
