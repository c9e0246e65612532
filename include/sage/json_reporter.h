#pragma once

#include <sage/interfaces.h>
#include <sage/models.h>

#include <filesystem>
#include <string>

namespace sage {

class JsonReporter : public Reporter {
public:
  std::string Render(const ProjectResult &result) const override;
};

std::string IssueToJson(const Issue &issue);

// Reads a report written by JsonReporter. Throws FileAccessError when the
// file is missing and SageError when it is not a report.
ProjectResult LoadJsonReport(const std::filesystem::path &path);
ProjectResult ParseJsonReport(const std::string &json);

} // namespace sage
