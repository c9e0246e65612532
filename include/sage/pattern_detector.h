#pragma once

#include <sage/models.h>
#include <sage/rule_catalog.h>

#include <string>
#include <vector>

namespace sage {

// Evaluates catalog rules line by line. Holds a reference to the catalog,
// which must outlive the detector.
class PatternDetector {
public:
  explicit PatternDetector(const RuleCatalog &catalog);

  std::vector<Issue> MatchFile(const std::string &file_path,
                               const std::string &content,
                               const std::string &language) const;
  std::vector<Issue> MatchLines(const std::string &file_path,
                                const std::vector<std::string> &lines,
                                const std::string &language) const;

private:
  const RuleCatalog &catalog_;
};

} // namespace sage
