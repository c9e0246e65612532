#include <sage/enrichment.h>

#include <sage/taxonomy.h>

#include <algorithm>
#include <exception>
#include <string>

namespace sage {

std::size_t EnrichTopIssues(std::vector<Issue> &issues, IssueEnricher &enricher,
                            std::size_t max_issues,
                            const std::shared_ptr<Logger> &logger) {
  const auto log = EnsureLogger(logger);
  const auto limit = std::min(max_issues, issues.size());
  std::size_t enriched = 0;
  for (std::size_t i = 0; i < limit; ++i) {
    auto &issue = issues[i];
    std::optional<Enrichment> enrichment;
    try {
      enrichment = enricher.Enrich(issue);
    } catch (const std::exception &error) {
      log->Log(LogLevel::kWarn, "enrichment.failed",
               {{"issue", issue.id},
                {"path", issue.location.file_path},
                {"line", std::to_string(issue.location.line_start)},
                {"error", error.what()}});
      continue;
    }
    if (!enrichment) {
      continue;
    }
    bool changed = false;
    if (enrichment->explanation && !issue.ai_explanation) {
      issue.ai_explanation = enrichment->explanation;
      changed = true;
    }
    if (enrichment->suggested_fix && !issue.suggested_fix) {
      issue.suggested_fix = enrichment->suggested_fix;
      changed = true;
    }
    if (enrichment->fix_description && !issue.fix_description) {
      issue.fix_description = enrichment->fix_description;
      changed = true;
    }
    if (changed) {
      ++enriched;
    }
  }
  log->Log(LogLevel::kInfo, "enrichment.completed",
           {{"considered", std::to_string(limit)},
            {"enriched", std::to_string(enriched)}});
  return enriched;
}

CatalogEnricher::CatalogEnricher(const RuleCatalog &catalog)
    : catalog_(catalog) {}

std::optional<Enrichment> CatalogEnricher::Enrich(const Issue &issue) {
  if (!issue.rule_id) {
    return std::nullopt;
  }
  const auto *rule = catalog_.Find(*issue.rule_id);
  if (rule == nullptr) {
    return std::nullopt;
  }
  const auto &definition = rule->definition;
  Enrichment enrichment;
  enrichment.explanation = definition.name + " (" +
                           SeverityName(definition.severity) + " " +
                           CategoryName(definition.category) + "): " +
                           definition.description;
  if (definition.fix_suggestion) {
    enrichment.fix_description = *definition.fix_suggestion;
  }
  return enrichment;
}

} // namespace sage
