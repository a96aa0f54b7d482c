#pragma once

#include "URL.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

class HttpResponse {
 public:
  HttpResponse() = default;

  /// Parse one raw header line (e.g. "Content-Type: text/html"). A status
  /// line ("HTTP/1.1 301 ...") starts a new header block after a redirect.
  void AddHeaderLine(const std::string& line);

  /// Append to the response body
  void AppendBody(const char* data, size_t len);

  /// Return the first header value matching `key` (case-insensitive)
  std::optional<std::string> GetHeader(const std::string& key) const;

  /// Return all header values matching `key` (case-insensitive)
  std::vector<std::string> GetHeaders(const std::string& key) const;

  /// All parsed header (name,value) pairs of the final response, in order
  const std::vector<std::pair<std::string, std::string>>& GetHeaders() const;

  /// The accumulated body bytes
  const std::string& GetBody() const;

  /// Media type without parameters, lowercased ("text/css")
  std::string GetContentType() const;

  void SetStatusCode(long http_status);
  long GetStatusCode() const;

  void SetEffectiveUrl(const std::string& url);
  const URL& GetEffectiveUrl() const;

  /// Transport-level failure (timeout, DNS, TLS ...). Empty on success.
  void SetError(const std::string& error, bool timed_out = false);
  const std::string& GetError() const;
  bool IsTimeout() const;

  /// HTTP status code is 200 to 299 and no transport error
  bool IsOkay() const;

 private:
  std::vector<std::pair<std::string, std::string>> headers_;
  std::string body_;
  long status_code_{0};
  URL effective_url_;
  std::string error_;
  bool timed_out_{false};
};
