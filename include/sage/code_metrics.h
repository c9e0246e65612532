#pragma once

#include <sage/models.h>

#include <string>
#include <vector>

namespace sage {

enum class CommentStyle { kHash, kCFamily };

// Line counts only; function statistics are filled in by the detector.
CodeMetrics CountLines(const std::vector<std::string> &lines,
                       CommentStyle style);

void ApplyComplexities(CodeMetrics &metrics,
                       const std::vector<int> &complexities);

} // namespace sage
