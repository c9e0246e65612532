#include <sage/file_discovery.h>

#include <sage/errors.h>

#include <fnmatch.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>

namespace sage {
namespace {

bool IsVendoredDirectory(const std::string &name) {
  static const std::set<std::string> kDirectories = {
      "__pycache__", ".git",  ".svn",  ".hg",           "node_modules",
      "venv",        ".venv", "env",   ".env",          "build",
      "dist",        ".tox",  ".mypy_cache", ".pytest_cache"};
  return kDirectories.count(name) > 0;
}

std::string TrimWhitespace(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

// Directory patterns ("build/") and anchored patterns ("/out") are reduced
// to plain globs matched against every path component.
std::string NormalizePattern(std::string pattern) {
  while (pattern.size() > 1 && pattern.back() == '/') {
    pattern.pop_back();
  }
  if (pattern.size() > 1 && pattern.front() == '/') {
    pattern.erase(pattern.begin());
  }
  return pattern;
}

} // namespace

const std::vector<std::string> &DefaultIncludePatterns() {
  static const std::vector<std::string> kPatterns = {
      "*.py",  "*.pyw", "*.js",  "*.jsx", "*.mjs", "*.cjs",
      "*.ts",  "*.tsx", "*.c",   "*.cc",  "*.cpp", "*.cxx",
      "*.c++", "*.h",   "*.hh",  "*.hpp", "*.hxx"};
  return kPatterns;
}

const std::vector<std::string> &DefaultIgnorePatterns() {
  static const std::vector<std::string> kPatterns = {
      "node_modules/*", "venv/*",       "env/*",  ".git/*",
      "*.min.js",       "*.bundle.js",  "build/*", "dist/*",
      "*.pyc",          "__pycache__/*"};
  return kPatterns;
}

bool GlobMatch(const std::string &pattern, const std::string &text) {
  return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

std::vector<std::string>
ReadGitignorePatterns(const std::filesystem::path &gitignore) {
  std::vector<std::string> patterns;
  std::ifstream stream(gitignore);
  if (!stream) {
    return patterns;
  }
  std::string line;
  while (std::getline(stream, line)) {
    line = TrimWhitespace(line);
    // Negations cannot be expressed as an extra exclusion; they are dropped.
    if (line.empty() || line.front() == '#' || line.front() == '!') {
      continue;
    }
    patterns.push_back(NormalizePattern(line));
  }
  return patterns;
}

GlobFileDiscovery::GlobFileDiscovery(DiscoveryOptions options,
                                     std::shared_ptr<Logger> logger)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {
  for (auto &pattern : options_.ignore_patterns) {
    pattern = NormalizePattern(pattern);
  }
}

bool GlobFileDiscovery::IsIncluded(const std::filesystem::path &path) const {
  if (options_.include_patterns.empty()) {
    return true;
  }
  const auto name = path.filename().string();
  return std::any_of(
      options_.include_patterns.begin(), options_.include_patterns.end(),
      [&](const std::string &pattern) { return GlobMatch(pattern, name); });
}

bool GlobFileDiscovery::IsIgnored(
    const std::filesystem::path &relative,
    const std::vector<std::string> &patterns) const {
  const auto relative_text = relative.generic_string();
  for (const auto &pattern : patterns) {
    if (GlobMatch(pattern, relative_text)) {
      return true;
    }
    for (const auto &component : relative) {
      if (GlobMatch(pattern, component.string())) {
        return true;
      }
    }
  }
  return false;
}

std::vector<std::filesystem::path>
GlobFileDiscovery::Discover(const std::filesystem::path &root) const {
  std::error_code error;
  if (!std::filesystem::exists(root, error)) {
    throw FileAccessError("Path does not exist", root.string());
  }

  if (std::filesystem::is_regular_file(root, error)) {
    if (IsIncluded(root)) {
      return {root};
    }
    return {};
  }

  auto patterns = options_.ignore_patterns;
  if (options_.respect_gitignore) {
    const auto gitignore = ReadGitignorePatterns(root / ".gitignore");
    patterns.insert(patterns.end(), gitignore.begin(), gitignore.end());
  }

  std::vector<std::filesystem::path> files;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, error);
  if (error) {
    throw FileAccessError("Cannot list directory: " + error.message(),
                          root.string());
  }
  const auto end = std::filesystem::end(it);
  for (; it != end; it.increment(error)) {
    if (error) {
      logger_->Log(LogLevel::kWarn, "discovery.walk_failed",
                   {{"path", root.string()}, {"error", error.message()}});
      error.clear();
      continue;
    }
    const auto &entry = *it;
    const auto relative = entry.path().lexically_relative(root);
    if (entry.is_directory(error)) {
      if (IsVendoredDirectory(entry.path().filename().string()) ||
          IsIgnored(relative, patterns)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(error)) {
      continue;
    }
    if (IsIgnored(relative, patterns) || !IsIncluded(entry.path())) {
      continue;
    }
    files.push_back(entry.path().lexically_normal());
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  logger_->Log(LogLevel::kInfo, "discovery.completed",
               {{"root", root.string()},
                {"files", std::to_string(files.size())}});
  return files;
}

} // namespace sage
