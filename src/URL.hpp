#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

class URL {
 public:
  URL() = default;
  explicit URL(const std::string& url_string);

  URL& operator=(const std::string& url_string);

  /// Resolve a reference (absolute, protocol-relative, absolute-path or
  /// relative) against this URL as base.
  URL Resolve(const URL& ref) const;
  URL Resolve(const std::string& ref) const;

  bool IsValid() const;
  bool IsHttp() const;  // http or https
  std::string GetScheme() const;
  std::string GetHost() const;
  int GetPort() const;  // explicit port, or the scheme default (80/443)
  std::string GetPath() const;
  std::string GetQuery() const;  // includes the leading '?'
  std::string GetFragment() const;

  /// "https://host[:port]" with default ports omitted.
  std::string GetOrigin() const;

  /// Same scheme, host and effective port.
  bool SameOrigin(const URL& other) const;

  /// Canonical form without fragment: lowercased scheme and host, default
  /// port dropped, dot-segments removed, empty path becomes "/".
  URL Canonical() const;

  void SetPath(const std::string& p);
  void SetQuery(const std::string& q);
  void SetFragment(const std::string& f);

  const char* c_str() const;
  std::string ToString() const;
  std::uint64_t GetID() const noexcept;
  std::string GetSha256() const;

  bool operator==(const URL& other) const {
    return ToString() == other.ToString();
  }
  bool operator!=(const URL& other) const {
    return !(*this == other);
  }
  bool operator<(URL const& other) const {
    return ToString() < other.ToString();
  }

 private:
  std::string raw_url_;
  std::string scheme_, host_, path_, query_, fragment_;
  int port_{0};  // 0 == not given
  mutable std::string text_;
  mutable std::string sha256_;
  mutable std::uint64_t id64_{0};

  void Parse();
  void Invalidate();
};

inline std::ostream& operator<<(std::ostream& os, const URL& u) {
  os << u.ToString();
  return os;
}

// allow URL as an unordered_{map,set} key directly.
namespace std {
template <>
struct hash<URL> {
  size_t operator()(const URL& u) const noexcept {
    return static_cast<size_t>(u.GetID());
  }
};
}  // namespace std
