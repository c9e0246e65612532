#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sage {

class SageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class FileAccessError : public SageError {
public:
  FileAccessError(const std::string &message, std::string path)
      : SageError(path + ": " + message), path_(std::move(path)) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

class ConfigurationError : public SageError {
public:
  using SageError::SageError;
};

class AnalysisCancelled : public SageError {
public:
  AnalysisCancelled() : SageError("Analysis cancelled") {}
};

} // namespace sage
