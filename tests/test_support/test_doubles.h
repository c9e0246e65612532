#ifndef SAGE_TEST_SUPPORT_TEST_DOUBLES_H
#define SAGE_TEST_SUPPORT_TEST_DOUBLES_H

#include <sage/errors.h>
#include <sage/interfaces.h>
#include <sage/issue_factory.h>

#include <gmock/gmock.h>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sage {
namespace test {

class MockDetector : public Detector {
public:
  MOCK_METHOD(std::string, Language, (), (const, override));
  MOCK_METHOD(bool, CanAnalyze, (const std::filesystem::path &),
              (const, override));
  MOCK_METHOD(FileRecord, Analyze, (const std::filesystem::path &),
              (const, override));
};

// Claims one extension and answers with whatever `produce` builds.
class FakeDetector : public Detector {
public:
  using Producer = std::function<FileRecord(const std::filesystem::path &)>;

  FakeDetector(std::string language, std::string extension, Producer produce)
      : language_(std::move(language)), extension_(std::move(extension)),
        produce_(std::move(produce)) {}

  std::string Language() const override { return language_; }
  bool CanAnalyze(const std::filesystem::path &path) const override {
    return path.extension() == extension_;
  }
  FileRecord Analyze(const std::filesystem::path &path) const override {
    return produce_(path);
  }

private:
  std::string language_;
  std::string extension_;
  Producer produce_;
};

class InMemoryReader : public SourceReader {
public:
  void Put(const std::filesystem::path &path, std::string content) {
    files_[path.string()] = std::move(content);
  }

  std::string Read(const std::filesystem::path &path) const override {
    const auto found = files_.find(path.string());
    if (found == files_.end()) {
      throw FileAccessError("not in memory", path.string());
    }
    return found->second;
  }

private:
  std::map<std::string, std::string> files_;
};

class FixedDiscovery : public FileDiscovery {
public:
  explicit FixedDiscovery(std::vector<std::filesystem::path> files)
      : files_(std::move(files)) {}

  std::vector<std::filesystem::path>
  Discover(const std::filesystem::path &) const override {
    return files_;
  }

private:
  std::vector<std::filesystem::path> files_;
};

class MockEnricher : public IssueEnricher {
public:
  MOCK_METHOD(std::optional<Enrichment>, Enrich, (const Issue &), (override));
};

inline Issue MakeTestIssue(const std::string &file_path,
                           const std::string &check, int line,
                           Severity severity, Category category) {
  auto issue = NewIssue(file_path, check, line, line);
  issue.title = check;
  issue.description = "found " + check;
  issue.severity = severity;
  issue.category = category;
  return issue;
}

} // namespace test
} // namespace sage

#endif // SAGE_TEST_SUPPORT_TEST_DOUBLES_H
