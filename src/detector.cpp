#include <sage/interfaces.h>

#include <sage/issue_factory.h>

#include <chrono>
#include <exception>

namespace sage {

FileRecord AnalyzeWithTiming(const Detector &detector,
                             const std::filesystem::path &path) {
  const auto start = std::chrono::steady_clock::now();
  FileRecord record;
  try {
    record = detector.Analyze(path);
  } catch (const std::exception &error) {
    record = MakeFailedRecord(path.string(), detector.Language(), error.what());
  } catch (...) {
    record = MakeFailedRecord(path.string(), detector.Language(),
                              "unexpected detector fault");
  }
  if (!record.success) {
    record.issues.clear();
  }
  record.analysis_time = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - start)
                             .count();
  return record;
}

} // namespace sage
