#include "URL.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <iomanip>
#include <openssl/sha.h>
#include <regex>
#include <sstream>
#include <string_view>
#include <vector>

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

int default_port(const std::string& scheme) {
  if (scheme == "http")
    return 80;
  if (scheme == "https")
    return 443;
  return 0;
}

// join and normalize "/a/b/../c" -> "/a/c"; a trailing slash survives
std::string normalize_path(const std::string& raw) {
  std::vector<std::string> parts;
  for (size_t i = 0, n = raw.size(); i < n;) {
    size_t j = raw.find('/', i);
    if (j == std::string::npos)
      j = n;
    std::string seg = raw.substr(i, j - i);
    if (seg == "..") {
      if (!parts.empty())
        parts.pop_back();
    } else if (seg != "" && seg != ".") {
      parts.push_back(seg);
    }
    i = j + 1;
  }
  std::string out = "/";
  for (size_t k = 0; k < parts.size(); ++k) {
    out += parts[k];
    if (k + 1 < parts.size())
      out += "/";
  }
  auto ends_with = [&raw](std::string_view tail) {
    return raw.size() >= tail.size() &&
           raw.compare(raw.size() - tail.size(), tail.size(), tail) == 0;
  };
  const bool dir_like = ends_with("/") || ends_with("/.") || ends_with("/..");
  if (dir_like && out.back() != '/')
    out += '/';
  return out;
}

bool has_scheme(const std::string& ref) {
  // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
  if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref[0])))
    return false;
  for (size_t i = 1; i < ref.size(); ++i) {
    char c = ref[i];
    if (c == ':')
      return true;
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' &&
        c != '.')
      return false;
  }
  return false;
}
}  // namespace

URL::URL(const std::string& url_string) : raw_url_(url_string) {
  Parse();
}

URL& URL::operator=(const std::string& url_string) {
  if (url_string.find("://") != std::string::npos) {
    raw_url_ = url_string;
    Parse();
  } else {
    URL resolved = this->Resolve(url_string);
    *this = resolved;
  }
  return *this;
}

URL URL::Resolve(const URL& ref) const {
  return Resolve(ref.ToString());
}

URL URL::Resolve(const std::string& ref_in) const {
  std::string ref = ref_in;
  // strip surrounding whitespace, common in hand-written markup
  auto l = ref.find_first_not_of(" \t\r\n");
  auto r = ref.find_last_not_of(" \t\r\n");
  ref = (l == std::string::npos) ? "" : ref.substr(l, r - l + 1);

  if (ref.find("://") != std::string::npos || has_scheme(ref)) {
    return URL(ref);
  }

  // Protocol-relative: inherit base scheme
  if (ref.size() >= 2 && ref[0] == '/' && ref[1] == '/') {
    return URL(scheme_ + ":" + ref);
  }

  std::string_view sv = ref;
  std::string frag, ref_query, ref_path;

  if (auto h = sv.find('#'); h != std::string::npos) {
    frag.assign(sv.substr(h + 1));
    sv = sv.substr(0, h);
  }
  if (auto q = sv.find('?'); q != std::string::npos) {
    ref_query.assign(sv.substr(q));  // keep leading '?'
    ref_path.assign(sv.substr(0, q));
  } else {
    ref_path.assign(sv);
  }

  std::string origin;
  if (!scheme_.empty()) {
    origin = scheme_ + "://" + host_;
    if (port_ != 0)
      origin += ":" + std::to_string(port_);
  }

  std::string path;
  if (ref_path.empty()) {
    path = path_.empty() ? "/" : path_;
  } else if (ref_path[0] == '/') {
    path = normalize_path(ref_path);
  } else {
    const std::string base_dir =
      path_.empty() ? "/" : path_.substr(0, path_.find_last_of('/') + 1);
    path = normalize_path(base_dir + ref_path);
  }

  // Query: ref wins; else inherit only when path is empty
  const std::string query = !ref_query.empty() ? ref_query
                            : ref_path.empty() ? query_
                                               : "";

  return URL(origin + path + query + (frag.empty() ? "" : "#" + frag));
}

void URL::Parse() {
  static const std::regex url_regex(
    // 2: scheme, 3: authority, 4: path, 5: query ('?'), 6: fragment ('#')
    R"(^(([A-Za-z][A-Za-z0-9+.-]*)://)?([^/?#]+)(/[^?#]*)?(\?[^#]*)?(#.*)?$)",
    std::regex::extended);
  Invalidate();
  scheme_.clear();
  host_.clear();
  path_.clear();
  query_.clear();
  fragment_.clear();
  port_ = 0;

  std::smatch match;
  if (!std::regex_match(raw_url_, match, url_regex)) {
    logr::debug << "[URL] invalid: " << raw_url_;
    return;
  }
  scheme_ = match[2].matched ? lowercase(match[2].str()) : "";
  std::string authority = match[3];
  path_ = match[4].matched ? match[4].str() : "";
  query_ = match[5].matched ? match[5].str() : "";
  fragment_ = match[6].matched ? match[6].str().substr(1) : "";

  // drop userinfo
  if (auto at = authority.rfind('@'); at != std::string::npos)
    authority = authority.substr(at + 1);

  // split port (IPv6 literals keep their brackets)
  auto colon = authority.rfind(':');
  auto bracket = authority.rfind(']');
  if (colon != std::string::npos &&
      (bracket == std::string::npos || colon > bracket)) {
    std::string port = authority.substr(colon + 1);
    authority = authority.substr(0, colon);
    if (!port.empty() &&
        std::all_of(port.begin(), port.end(),
                    [](unsigned char c) { return std::isdigit(c); }) &&
        port.size() <= 5) {
      port_ = std::stoi(port);
    }
  }
  host_ = lowercase(authority);
  if (port_ != 0 && port_ == default_port(scheme_))
    port_ = 0;
}

void URL::Invalidate() {
  text_.clear();
  sha256_.clear();
  id64_ = 0;
}

bool URL::IsValid() const {
  return !scheme_.empty() && !host_.empty();
}

bool URL::IsHttp() const {
  return IsValid() && (scheme_ == "http" || scheme_ == "https");
}

std::string URL::GetScheme() const {
  return scheme_;
}

std::string URL::GetHost() const {
  return host_;
}

int URL::GetPort() const {
  return port_ != 0 ? port_ : default_port(scheme_);
}

std::string URL::GetPath() const {
  return path_;
}

std::string URL::GetQuery() const {
  return query_;
}

std::string URL::GetFragment() const {
  return fragment_;
}

std::string URL::GetOrigin() const {
  if (!IsValid())
    return "";
  std::string origin = scheme_ + "://" + host_;
  if (port_ != 0)
    origin += ":" + std::to_string(port_);
  return origin;
}

bool URL::SameOrigin(const URL& other) const {
  return scheme_ == other.scheme_ && host_ == other.host_ &&
         GetPort() == other.GetPort();
}

URL URL::Canonical() const {
  URL out = *this;
  out.fragment_.clear();
  out.path_ = path_.empty() ? "/" : normalize_path(path_);
  if (out.query_ == "?")
    out.query_.clear();
  out.Invalidate();
  return out;
}

void URL::SetPath(const std::string& p) {
  path_ = p;
  Invalidate();
}

void URL::SetQuery(const std::string& q) {
  query_ = (q.empty() || q[0] == '?') ? q : "?" + q;
  Invalidate();
}

void URL::SetFragment(const std::string& f) {
  fragment_ = f;
  Invalidate();
}

std::string URL::ToString() const {
  if (!text_.empty())
    return text_;

  std::string url;
  if (!scheme_.empty()) {
    url += scheme_;
    url += "://";
  }
  url += host_;
  if (port_ != 0) {
    url += ':';
    url += std::to_string(port_);
  }
  if (!path_.empty()) {
    if (path_[0] != '/') {
      url += '/';
    }
    url += path_;
  }
  url += query_;
  if (!fragment_.empty()) {
    url += '#';
    url += fragment_;
  }
  text_ = url;
  return text_;
}

const char* URL::c_str() const {
  ToString();
  return text_.c_str();
}

std::string URL::GetSha256() const {
  if (sha256_.empty()) {
    auto url = ToString();
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(url.c_str()), url.size(),
           hash);
    std::ostringstream oss;
    for (auto byte : hash) {
      oss << std::hex << std::setw(2) << std::setfill('0')
          << static_cast<int>(byte);
    }
    sha256_ = oss.str();
  }
  return sha256_;
}

std::uint64_t URL::GetID() const noexcept {
  if (id64_ == 0) {
    // FNV-1a over the canonical text; stable across runs
    std::uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : ToString()) {
      h ^= c;
      h *= 1099511628211ULL;
    }
    id64_ = h;
  }
  return id64_;
}
