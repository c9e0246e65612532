#include <sage/issue_factory.h>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace sage {
namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr std::size_t kIdLength = 12;

std::uint64_t Fnv1a(std::string_view data) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const auto character : data) {
    hash ^= static_cast<unsigned char>(character);
    hash *= kFnvPrime;
  }
  return hash;
}

} // namespace

std::string MakeIssueId(const std::string &file_path,
                        const std::string &check_id, int line) {
  const auto key = file_path + ":" + check_id + ":" + std::to_string(line);
  std::ostringstream stream;
  stream << std::hex << std::setw(16) << std::setfill('0') << Fnv1a(key);
  return stream.str().substr(0, kIdLength);
}

Issue NewIssue(const std::string &file_path, const std::string &check_id,
               int line_start, int line_end) {
  Issue issue;
  issue.id = MakeIssueId(file_path, check_id, line_start);
  issue.location.file_path = file_path;
  issue.location.line_start = line_start;
  issue.location.line_end = std::max(line_start, line_end);
  issue.metadata["check"] = check_id;
  return issue;
}

std::vector<std::string> SplitLines(std::string_view content) {
  std::vector<std::string> lines;
  std::string current;
  for (std::size_t i = 0; i < content.size(); ++i) {
    const auto character = content[i];
    if (character == '\r') {
      if (i + 1 < content.size() && content[i + 1] == '\n') {
        ++i;
      }
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    if (character == '\n') {
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    lines.push_back(std::move(current));
  }
  return lines;
}

std::string FormatSnippet(const std::vector<std::string> &lines,
                          int line_start, int line_end, int context) {
  if (lines.empty() || line_start < 1) {
    return {};
  }
  const auto total = static_cast<int>(lines.size());
  const int first = std::max(1, line_start - context);
  const int last = std::min(total, std::max(line_start, line_end) + context);

  std::ostringstream snippet;
  for (int number = first; number <= last; ++number) {
    if (number > first) {
      snippet << "\n";
    }
    const bool highlighted = number >= line_start && number <= line_end;
    snippet << (highlighted ? "> " : "  ") << std::setw(4) << number << " | "
            << lines[static_cast<std::size_t>(number - 1)];
  }
  return snippet.str();
}

std::string CheckIdOf(const Issue &issue) {
  if (issue.rule_id) {
    return *issue.rule_id;
  }
  const auto check = issue.metadata.find("check");
  return check == issue.metadata.end() ? std::string() : check->second;
}

FileRecord MakeFailedRecord(const std::string &file_path,
                            const std::string &language,
                            const std::string &error) {
  FileRecord record;
  record.file_path = file_path;
  record.language = language;
  record.success = false;
  record.error = error;
  return record;
}

} // namespace sage
