#pragma once

#include <stdexcept>
#include <string>

// Root document could not be retrieved. Dependent resources never throw this;
// they are recorded as unresolved references instead.
class FetchError : public std::runtime_error {
 public:
  FetchError(const std::string& url, const std::string& cause)
      : std::runtime_error("fetch failed for " + url + ": " + cause),
        url_{url},
        cause_{cause} {
  }

  const std::string& url() const {
    return url_;
  }
  const std::string& cause() const {
    return cause_;
  }

 private:
  std::string url_;
  std::string cause_;
};

// The mirror directory holds files pagelift did not create, so it is not
// cleared.
class OutputDirError : public std::runtime_error {
 public:
  explicit OutputDirError(const std::string& what)
      : std::runtime_error("refusing to use output directory: " + what) {
  }
};

// The layout collaborator produced no usable geometry.
class NoViewportDataError : public std::runtime_error {
 public:
  explicit NoViewportDataError(const std::string& what)
      : std::runtime_error("no viewport data: " + what) {
  }
};

class AuditError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Analyzer could not be launched, exited non-zero or wrote malformed output.
class AuditUnavailableError : public AuditError {
 public:
  explicit AuditUnavailableError(const std::string& what)
      : AuditError("audit unavailable: " + what) {
  }
};

class AuditTimeoutError : public AuditError {
 public:
  explicit AuditTimeoutError(const std::string& what)
      : AuditError("audit timed out: " + what) {
  }
};
