#pragma once

#include <sage/interfaces.h>
#include <sage/logging.h>
#include <sage/models.h>
#include <sage/python_ast.h>

#include <memory>
#include <string>
#include <vector>

namespace sage {

struct PythonFunction {
  const python::Stmt *node = nullptr;
  // `Class.method` for methods, the bare name otherwise.
  std::string qualified_name;
  int complexity = 1;
};

std::vector<PythonFunction> CollectPythonFunctions(const python::Module &module);

// 1 + decision points of the function body; nested functions and classes
// are measured on their own.
int CyclomaticComplexity(const python::Stmt &function);

// Runs every check over a parsed module. `lines` feeds the code snippets.
std::vector<Issue> CheckPythonModule(const std::string &file_path,
                                     const python::Module &module,
                                     const std::vector<std::string> &lines,
                                     const AnalysisSettings &settings);

Issue MakeSyntaxErrorIssue(const std::string &file_path,
                           const python::SyntaxError &error,
                           const std::vector<std::string> &lines);

class PythonDetector : public Detector {
public:
  explicit PythonDetector(AnalysisSettings settings = {},
                          std::shared_ptr<const SourceReader> reader = nullptr,
                          std::shared_ptr<Logger> logger = nullptr);

  std::string Language() const override { return "python"; }
  bool CanAnalyze(const std::filesystem::path &path) const override;
  FileRecord Analyze(const std::filesystem::path &path) const override;

  FileRecord AnalyzeSource(const std::string &file_path,
                           const std::string &content) const;

private:
  AnalysisSettings settings_;
  std::shared_ptr<const SourceReader> reader_;
  std::shared_ptr<Logger> logger_;
};

} // namespace sage
