#pragma once

#include <sage/models.h>

namespace sage {

constexpr int kExitClean = 0;
constexpr int kExitError = 1;
constexpr int kExitCritical = 2;

// kExitCritical when any CRITICAL issue survived filtering.
int AnalysisExitCode(const ProjectResult &result);

} // namespace sage
