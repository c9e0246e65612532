#pragma once

#include <sage/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sage {

class SourceReader {
public:
  virtual ~SourceReader() = default;
  // Throws FileAccessError when the file cannot be read.
  virtual std::string Read(const std::filesystem::path &path) const = 0;
};

class FileDiscovery {
public:
  virtual ~FileDiscovery() = default;
  // Sorted and free of duplicates.
  virtual std::vector<std::filesystem::path>
  Discover(const std::filesystem::path &root) const = 0;
};

class Detector {
public:
  virtual ~Detector() = default;
  virtual std::string Language() const = 0;
  virtual bool CanAnalyze(const std::filesystem::path &path) const = 0;
  // Expected failures come back as a record with success == false.
  virtual FileRecord Analyze(const std::filesystem::path &path) const = 0;
};

FileRecord AnalyzeWithTiming(const Detector &detector,
                             const std::filesystem::path &path);

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual std::string Render(const ProjectResult &result) const = 0;
};

struct Enrichment {
  std::optional<std::string> explanation;
  std::optional<std::string> suggested_fix;
  std::optional<std::string> fix_description;
};

class IssueEnricher {
public:
  virtual ~IssueEnricher() = default;
  virtual std::optional<Enrichment> Enrich(const Issue &issue) = 0;
};

} // namespace sage
