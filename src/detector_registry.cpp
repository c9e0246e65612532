#include <sage/detector_registry.h>

#include <sage/clang_detector.h>
#include <sage/lexical_detector.h>
#include <sage/python_detector.h>
#include <sage/source_reader.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sage {

void DetectorRegistry::Register(std::unique_ptr<Detector> detector) {
  if (frozen_) {
    throw std::logic_error("Detector registry is frozen");
  }
  if (!detector) {
    throw std::invalid_argument("Detector cannot be null");
  }
  detectors_.push_back(std::move(detector));
}

const Detector *
DetectorRegistry::GetDetector(const std::filesystem::path &path) const {
  for (const auto &detector : detectors_) {
    if (detector->CanAnalyze(path)) {
      return detector.get();
    }
  }
  return nullptr;
}

std::vector<std::string> DetectorRegistry::SupportedLanguages() const {
  std::vector<std::string> languages;
  for (const auto &detector : detectors_) {
    auto language = detector->Language();
    if (std::find(languages.begin(), languages.end(), language) ==
        languages.end()) {
      languages.push_back(std::move(language));
    }
  }
  return languages;
}

DetectorRegistry
MakeDefaultDetectorRegistry(const AnalysisSettings &settings,
                            std::shared_ptr<const SourceReader> reader,
                            std::shared_ptr<Logger> logger) {
  if (!reader) {
    reader = std::make_shared<FileSourceReader>();
  }
  logger = EnsureLogger(std::move(logger));

  DetectorRegistry registry;
  registry.Register(std::make_unique<PythonDetector>(settings, reader, logger));
  registry.Register(MakeCDetector(settings, reader, logger));
  registry.Register(MakeCppDetector(settings, reader, logger));
  // .ts and .tsx are accepted by both lexical detectors; TypeScript must
  // come first to claim them.
  registry.Register(MakeTypeScriptDetector(reader, logger));
  registry.Register(MakeJavaScriptDetector(reader, logger));
  registry.Freeze();
  return registry;
}

} // namespace sage
