#pragma once

#include <sage/interfaces.h>
#include <sage/models.h>

#include <string>

namespace sage {

// Plain-text layout: a summary table, then the issues of each file with
// severity tags and locations.
class ConsoleReporter : public Reporter {
public:
  explicit ConsoleReporter(bool show_snippets = true)
      : show_snippets_(show_snippets) {}

  std::string Render(const ProjectResult &result) const override;

private:
  bool show_snippets_;
};

} // namespace sage
