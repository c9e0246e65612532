#pragma once

#include <sage/models.h>

#include <string>
#include <string_view>
#include <vector>

namespace sage {

// Twelve hex digits derived from "<path>:<check>:<line>"; identical input
// always yields an identical id.
std::string MakeIssueId(const std::string &file_path,
                        const std::string &check_id, int line);

// Issue with id, location and metadata["check"] filled in; the caller
// supplies the rest.
Issue NewIssue(const std::string &file_path, const std::string &check_id,
               int line_start, int line_end);

std::vector<std::string> SplitLines(std::string_view content);

std::string FormatSnippet(const std::vector<std::string> &lines,
                          int line_start, int line_end, int context = 2);

// Rule id for catalog findings, otherwise the check id.
std::string CheckIdOf(const Issue &issue);

FileRecord MakeFailedRecord(const std::string &file_path,
                            const std::string &language,
                            const std::string &error);

} // namespace sage
