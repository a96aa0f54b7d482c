#pragma once

#include <filesystem>
#include <string>

#include "ArtifactWriter.hpp"
#include "Resource.hpp"
#include "URL.hpp"

// Local mirror of a site: <site_dir>/<original relative path>. Resources from
// other origins live under _ext/<host>/<path>.
class MirrorStore {
 public:
  MirrorStore(const std::filesystem::path& site_dir, const URL& root);
  MirrorStore(const MirrorStore&) = delete;

  // Removes whatever a previous run left for this site and marks the
  // directory as a mirror. Throws OutputDirError for a path that is not a
  // directory or a non-empty directory without the marker.
  void Reset();

  static constexpr const char* kMarker = ".pagelift-mirror";

  // Relative mirror path for `url`. Directory-like paths map to index.html
  // (HTML) or index.<ext>; a query string, or a segment that had to be
  // sanitized, adds a short hash before the extension so distinct URLs never
  // share a file.
  std::filesystem::path LocalPathFor(const URL& url, ResourceKind kind) const;

  bool Store(const std::filesystem::path& relative, const std::string& bytes);

  const std::filesystem::path& SiteDir() const;

 private:
  std::filesystem::path site_dir_;
  URL root_;
  ArtifactWriter writer_;
};
