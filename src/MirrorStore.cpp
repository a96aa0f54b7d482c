#include "MirrorStore.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <array>
#include <cctype>
#include <vector>

namespace {

// Artifacts the pipeline writes next to the mirror.
constexpr std::array<const char*, 8> kReserved = {
  "optimized.html",        "critical.css",          "actions.json",
  "comparison_report.md",  "comparison_report.html", "comparison_report.json",
  "run.json",              MirrorStore::kMarker};

const char* DefaultExtension(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::Html:
      return ".html";
    case ResourceKind::Css:
      return ".css";
    case ResourceKind::Js:
      return ".js";
    default:
      return "";
  }
}

std::string Sanitize(const std::string& segment) {
  std::string out;
  out.reserve(segment.size());
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '.' || c == '-' || c == '_')
      out.push_back(static_cast<char>(c));
    else
      out.push_back('_');
  }
  if (out == "." || out == "..")
    out = "_";
  return out;
}
}  // namespace

MirrorStore::MirrorStore(const std::filesystem::path& site_dir,
                         const URL& root)
    : site_dir_{site_dir}, root_{root.Canonical()}, writer_{site_dir} {
}

void MirrorStore::Reset() {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (fs::exists(site_dir_, ec)) {
    if (!fs::is_directory(site_dir_, ec))
      throw OutputDirError(site_dir_.string() + " is not a directory");
    if (!fs::is_empty(site_dir_, ec) && !fs::exists(site_dir_ / kMarker, ec))
      throw OutputDirError(site_dir_.string() +
                           " is not empty and was not created by pagelift");
    logr::debug << "[MirrorStore] removing previous run at " << site_dir_;
    std::filesystem::remove_all(site_dir_, ec);
    if (ec) {
      logr::warning << "[MirrorStore] could not clear " << site_dir_ << ": "
                    << ec.message();
    }
  }
  std::filesystem::create_directories(site_dir_, ec);
  if (!writer_.Save(kMarker, std::string{}))
    logr::warning << "[MirrorStore] could not mark " << site_dir_;
}

std::filesystem::path MirrorStore::LocalPathFor(const URL& url,
                                                ResourceKind kind) const {
  std::filesystem::path rel;
  if (!url.SameOrigin(root_)) {
    rel = std::filesystem::path{"_ext"} / Sanitize(url.GetHost());
  }

  std::string path = url.GetPath();
  if (path.empty())
    path = "/";

  std::string segment;
  std::vector<std::string> segments;
  bool renamed = false;
  for (size_t i = 1; i <= path.size(); ++i) {
    if (i == path.size() || path[i] == '/') {
      if (!segment.empty()) {
        segments.push_back(Sanitize(segment));
        renamed = renamed || segments.back() != segment;
      }
      segment.clear();
    } else {
      segment.push_back(path[i]);
    }
  }
  bool directory_like = path.back() == '/' || segments.empty();
  std::string leaf;
  if (directory_like) {
    leaf = kind == ResourceKind::Html ? "index.html"
                                      : std::string{"index"} +
                                          DefaultExtension(kind);
  } else {
    leaf = segments.back();
    segments.pop_back();
  }
  for (const auto& s : segments)
    rel /= s;

  // "a%20b.png" and "a_20b.png" sanitize alike; the hash keeps them apart
  if (!url.GetQuery().empty() || renamed) {
    std::filesystem::path leaf_path{leaf};
    std::string stem = leaf_path.stem().string();
    std::string ext = leaf_path.extension().string();
    if (ext.empty())
      ext = DefaultExtension(kind);
    leaf = stem + "-" + url.GetSha256().substr(0, 8) + ext;
  }

  if (rel.empty()) {
    for (const char* reserved : kReserved) {
      if (leaf == reserved) {
        leaf = "_mirror-" + leaf;
        break;
      }
    }
  }
  return rel / leaf;
}

bool MirrorStore::Store(const std::filesystem::path& relative,
                        const std::string& bytes) {
  return writer_.Save(relative, bytes);
}

const std::filesystem::path& MirrorStore::SiteDir() const {
  return site_dir_;
}
