#pragma once

#include <sage/models.h>

#include <string>
#include <vector>

namespace sage {

// Position of a severity in the total order INFO < LOW < MEDIUM < HIGH <
// CRITICAL. Comparisons go through this table, never the enumerator values.
int SeverityRank(Severity severity);
bool IsAtLeast(Severity severity, Severity minimum);
bool IsHighPriority(Severity severity);

int SeverityWeight(Severity severity);
int CategoryWeight(Category category);

std::string SeverityName(Severity severity);
std::string CategoryName(Category category);
Severity ParseSeverity(const std::string &name);
Category ParseCategory(const std::string &name);

const std::vector<Severity> &AllSeverities();
const std::vector<Category> &AllCategories();

} // namespace sage
