#include "HttpResponse.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

void trim(std::string& s) {
  auto l = s.find_first_not_of(" \t\r\n");
  auto r = s.find_last_not_of(" \t\r\n");
  if (l == std::string::npos) {
    s.clear();
    return;
  }
  s = s.substr(l, r - l + 1);
}
}  // namespace

void HttpResponse::AddHeaderLine(const std::string& line) {
  if (line.rfind("HTTP/", 0) == 0) {
    // each hop of a redirect chain reports its own headers; keep the last
    headers_.clear();
    return;
  }

  auto colon = line.find(':');
  if (colon == std::string::npos)
    return;  // blank separator line

  std::string name = line.substr(0, colon);
  std::string value = line.substr(colon + 1);
  trim(name);
  trim(value);

  headers_.emplace_back(std::move(name), std::move(value));
}

void HttpResponse::AppendBody(const char* data, size_t len) {
  body_.append(data, len);
}

std::optional<std::string> HttpResponse::GetHeader(
  const std::string& key) const {
  std::string want = lowercase(key);
  for (auto const& [name, val] : headers_) {
    if (lowercase(name) == want) {
      return val;
    }
  }
  return std::nullopt;
}

std::vector<std::string> HttpResponse::GetHeaders(
  const std::string& key) const {
  std::vector<std::string> out;
  std::string want = lowercase(key);
  for (auto const& [name, val] : headers_) {
    if (lowercase(name) == want) {
      out.push_back(val);
    }
  }
  return out;
}

const std::vector<std::pair<std::string, std::string>>&
HttpResponse::GetHeaders() const {
  return headers_;
}

const std::string& HttpResponse::GetBody() const {
  return body_;
}

std::string HttpResponse::GetContentType() const {
  auto ct = GetHeader("Content-Type");
  if (!ct.has_value())
    return "";
  std::string type = ct->substr(0, ct->find(';'));
  trim(type);
  return lowercase(type);
}

void HttpResponse::SetStatusCode(long http_status) {
  status_code_ = http_status;
}

long HttpResponse::GetStatusCode() const {
  return status_code_;
}

void HttpResponse::SetEffectiveUrl(const std::string& url) {
  effective_url_ = URL(url);
}

const URL& HttpResponse::GetEffectiveUrl() const {
  return effective_url_;
}

void HttpResponse::SetError(const std::string& error, bool timed_out) {
  error_ = error;
  timed_out_ = timed_out;
}

const std::string& HttpResponse::GetError() const {
  return error_;
}

bool HttpResponse::IsTimeout() const {
  return timed_out_;
}

bool HttpResponse::IsOkay() const {
  return error_.empty() && status_code_ >= 200 && status_code_ < 300;
}
