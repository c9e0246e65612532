#pragma once

#include <sage/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sage {

class ReporterRegistry {
public:
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  // The first registration becomes the default unless another one asks.
  void Register(const std::string &name, ReporterFactory factory,
                bool set_as_default = false);

  // Empty name selects the default. Unknown names throw
  // std::invalid_argument listing the registered ones.
  std::unique_ptr<Reporter> Create(const std::string &name = "") const;

  bool Contains(const std::string &name) const;
  std::vector<std::string> Names() const;
  const std::string &DefaultName() const { return default_name_; }

private:
  std::string JoinNames() const;

  std::unordered_map<std::string, ReporterFactory> factories_;
  std::string default_name_;
};

// console (default), json and sarif.
ReporterRegistry MakeReporterRegistryWithDefaults();

} // namespace sage
