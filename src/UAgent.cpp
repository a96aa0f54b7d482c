#include "UAgent.hpp"
#include "Logger.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace {

std::string Trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  // also drops the CR of CRLF lists
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

// FNV-1a; std::hash is not stable across standard libraries.
std::uint64_t Fnv1a(const std::string& s) {
  std::uint64_t h = 14695981039346656037ull;
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return h;
}
}  // namespace

UAgent::UAgent() : entries_{kDefault} {
}

UAgent::UAgent(const std::filesystem::path& list_path, const std::string& site)
    : entries_{ReadList(list_path)},
      chosen_{static_cast<std::size_t>(Fnv1a(site) % entries_.size())} {
  IF_DEBUG {
    logr::debug << "[UAgent] " << site << " -> " << Get();
  }
}

std::vector<std::string> UAgent::ReadList(
  const std::filesystem::path& list_path) {
  std::ifstream in(list_path);
  if (!in) {
    throw std::runtime_error("UAgent: failed to open UA list: " +
                             list_path.string());
  }

  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) {
    std::string s = Trim(line);
    if (s.empty() || s[0] == '#' || s[0] == ';')
      continue;
    out.push_back(std::move(s));
  }
  if (out.empty()) {
    throw std::runtime_error("UAgent: no user-agent strings loaded from: " +
                             list_path.string());
  }
  return out;
}
