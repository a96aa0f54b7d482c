#pragma once
#include <filesystem>
#include <string>
#include <vector>

// User-Agent sent with every request of a run. One entry is pinned per run
// so the root document and its resources are served to the same client.
class UAgent {
 public:
  // Desktop Chrome, used when no list is configured.
  static constexpr const char* kDefault =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

  UAgent();

  // list_path: text file with one User-Agent per line (blank lines and lines
  // starting with '#' or ';' are ignored). The entry is chosen from `site`,
  // so reruns against the same site send the same agent.
  // Throws std::runtime_error when the list is unreadable or empty.
  UAgent(const std::filesystem::path& list_path, const std::string& site);

  const std::string& Get() const {
    return entries_[chosen_];
  }

  const std::vector<std::string>& Entries() const {
    return entries_;
  }

  static std::vector<std::string> ReadList(
    const std::filesystem::path& list_path);

 private:
  std::vector<std::string> entries_;
  std::size_t chosen_{0};
};
