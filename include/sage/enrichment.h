#pragma once

#include <sage/interfaces.h>
#include <sage/logging.h>
#include <sage/models.h>
#include <sage/rule_catalog.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace sage {

// Enriches the first `max_issues` entries of an already ranked list. Fields
// the issue already carries are kept. Returns the number of issues changed.
std::size_t EnrichTopIssues(std::vector<Issue> &issues, IssueEnricher &enricher,
                            std::size_t max_issues,
                            const std::shared_ptr<Logger> &logger);

// Offline enricher that explains rule findings from the catalog's own
// descriptions. Issues without a rule id are left alone.
class CatalogEnricher : public IssueEnricher {
public:
  explicit CatalogEnricher(const RuleCatalog &catalog);

  std::optional<Enrichment> Enrich(const Issue &issue) override;

private:
  const RuleCatalog &catalog_;
};

} // namespace sage
