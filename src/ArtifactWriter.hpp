#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Writes run artifacts below one directory. Every file is written to a
// sibling ".tmp" and renamed into place, so an interrupted run never leaves a
// truncated artifact behind.
class ArtifactWriter {
 public:
  explicit ArtifactWriter(const std::filesystem::path& dir);

  const std::filesystem::path& Dir() const;

  // `relative` may contain subdirectories; they are created on demand.
  bool Save(const std::filesystem::path& relative, const std::string& data);
  bool Save(const std::filesystem::path& relative, const nlohmann::json& data);

  // Paths written so far, in write order.
  std::vector<std::filesystem::path> Written() const;

 private:
  std::filesystem::path dir_;
  mutable std::mutex mu_;
  std::vector<std::filesystem::path> written_;
};
