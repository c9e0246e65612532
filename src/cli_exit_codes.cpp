#include <sage/cli_exit_codes.h>

#include <sage/result_assembler.h>

namespace sage {

int AnalysisExitCode(const ProjectResult &result) {
  if (CountBySeverity(result, Severity::kCritical) > 0) {
    return kExitCritical;
  }
  return kExitClean;
}

} // namespace sage
