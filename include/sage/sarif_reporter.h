#pragma once

#include <sage/interfaces.h>
#include <sage/models.h>

#include <string>

namespace sage {

// SARIF 2.1.0 log with a single run.
class SarifReporter : public Reporter {
public:
  std::string Render(const ProjectResult &result) const override;
};

// critical/high -> error, medium -> warning, low -> note, info -> none.
std::string SarifLevel(Severity severity);

} // namespace sage
