#pragma once

#include <sage/interfaces.h>
#include <sage/logging.h>
#include <sage/models.h>

#include <memory>
#include <string>
#include <vector>

namespace sage {

// C and C++ detector backed by libclang. Each analysis creates its own
// CXIndex so instances can be shared between worker threads.
class ClangDetector : public Detector {
public:
  ClangDetector(std::string language, std::vector<std::string> extensions,
                AnalysisSettings settings = {},
                std::shared_ptr<const SourceReader> reader = nullptr,
                std::shared_ptr<Logger> logger = nullptr);

  std::string Language() const override { return language_; }
  bool CanAnalyze(const std::filesystem::path &path) const override;
  FileRecord Analyze(const std::filesystem::path &path) const override;

  FileRecord AnalyzeSource(const std::string &file_path,
                           const std::string &content) const;

private:
  std::vector<std::string> CompilerArguments() const;

  std::string language_;
  std::vector<std::string> extensions_;
  AnalysisSettings settings_;
  std::shared_ptr<const SourceReader> reader_;
  std::shared_ptr<Logger> logger_;
};

std::unique_ptr<Detector>
MakeCDetector(const AnalysisSettings &settings,
              std::shared_ptr<const SourceReader> reader,
              std::shared_ptr<Logger> logger);
std::unique_ptr<Detector>
MakeCppDetector(const AnalysisSettings &settings,
                std::shared_ptr<const SourceReader> reader,
                std::shared_ptr<Logger> logger);

} // namespace sage
