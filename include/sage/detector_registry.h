#pragma once

#include <sage/interfaces.h>
#include <sage/logging.h>
#include <sage/models.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace sage {

// Ordered list of detectors. When several detectors accept a path, the one
// registered first wins.
class DetectorRegistry {
public:
  void Register(std::unique_ptr<Detector> detector);

  // nullptr when no registered detector accepts the path.
  const Detector *GetDetector(const std::filesystem::path &path) const;

  // Distinct language ids in registration order.
  std::vector<std::string> SupportedLanguages() const;

  void Freeze() { frozen_ = true; }
  bool frozen() const { return frozen_; }
  std::size_t size() const { return detectors_.size(); }

private:
  std::vector<std::unique_ptr<Detector>> detectors_;
  bool frozen_ = false;
};

// Python, C, C++, TypeScript and JavaScript detectors, frozen.
DetectorRegistry
MakeDefaultDetectorRegistry(const AnalysisSettings &settings,
                            std::shared_ptr<const SourceReader> reader = nullptr,
                            std::shared_ptr<Logger> logger = nullptr);

} // namespace sage
