#pragma once

#include <sage/interfaces.h>
#include <sage/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace sage {

const std::vector<std::string> &DefaultIncludePatterns();
const std::vector<std::string> &DefaultIgnorePatterns();

struct DiscoveryOptions {
  std::vector<std::string> include_patterns = DefaultIncludePatterns();
  std::vector<std::string> ignore_patterns = DefaultIgnorePatterns();
  bool respect_gitignore = true;
};

// Shell-style match where `*` also crosses directory separators.
bool GlobMatch(const std::string &pattern, const std::string &text);

std::vector<std::string>
ReadGitignorePatterns(const std::filesystem::path &gitignore);

class GlobFileDiscovery : public FileDiscovery {
public:
  explicit GlobFileDiscovery(DiscoveryOptions options = {},
                             std::shared_ptr<Logger> logger = nullptr);

  // Throws FileAccessError when `root` does not exist.
  std::vector<std::filesystem::path>
  Discover(const std::filesystem::path &root) const override;

private:
  bool IsIncluded(const std::filesystem::path &path) const;
  bool IsIgnored(const std::filesystem::path &relative,
                 const std::vector<std::string> &patterns) const;

  DiscoveryOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace sage
