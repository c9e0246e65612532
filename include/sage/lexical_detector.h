#pragma once

#include <sage/interfaces.h>
#include <sage/logging.h>
#include <sage/rule_catalog.h>

#include <memory>
#include <string>
#include <vector>

namespace sage {

// Blanks `//` comments outside string literals. Columns are preserved.
std::string MaskLineComment(const std::string &line);

std::vector<RuleDefinition> LexicalRuleDefinitions(const std::string &language);

// Regex-only detector for languages without a parser in the tree.
class LexicalDetector : public Detector {
public:
  LexicalDetector(std::string language, std::vector<std::string> extensions,
                  std::vector<RuleDefinition> rules,
                  std::shared_ptr<const SourceReader> reader = nullptr,
                  std::shared_ptr<Logger> logger = nullptr);

  std::string Language() const override { return language_; }
  bool CanAnalyze(const std::filesystem::path &path) const override;
  FileRecord Analyze(const std::filesystem::path &path) const override;

  FileRecord AnalyzeSource(const std::string &file_path,
                           const std::string &content) const;

  const RuleCatalog &catalog() const { return catalog_; }

private:
  std::string language_;
  std::vector<std::string> extensions_;
  std::shared_ptr<const SourceReader> reader_;
  std::shared_ptr<Logger> logger_;
  RuleCatalog catalog_;
};

std::unique_ptr<Detector>
MakeJavaScriptDetector(std::shared_ptr<const SourceReader> reader,
                       std::shared_ptr<Logger> logger);
std::unique_ptr<Detector>
MakeTypeScriptDetector(std::shared_ptr<const SourceReader> reader,
                       std::shared_ptr<Logger> logger);

} // namespace sage
