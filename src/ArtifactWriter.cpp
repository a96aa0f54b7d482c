#include "ArtifactWriter.hpp"
#include "Logger.hpp"

#include <fstream>

ArtifactWriter::ArtifactWriter(const std::filesystem::path& dir) : dir_{dir} {
}

const std::filesystem::path& ArtifactWriter::Dir() const {
  return dir_;
}

bool ArtifactWriter::Save(const std::filesystem::path& relative,
                          const std::string& data) {
  std::filesystem::path filename = dir_ / relative;
  std::error_code ec;
  std::filesystem::create_directories(filename.parent_path(), ec);
  if (ec) {
    logr::error << "[ArtifactWriter] cannot create " << filename.parent_path()
                << ": " << ec.message();
    return false;
  }

  std::filesystem::path tmp = filename;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      logr::error << "[ArtifactWriter] write failed: " << tmp;
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::filesystem::rename(tmp, filename, ec);
  if (ec) {
    logr::error << "[ArtifactWriter] rename failed: " << filename << ": "
                << ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }

  std::lock_guard<std::mutex> lk(mu_);
  written_.push_back(filename);
  return true;
}

bool ArtifactWriter::Save(const std::filesystem::path& relative,
                          const nlohmann::json& data) {
  auto dumped = data.dump(2);
  dumped.push_back('\n');
  return Save(relative, dumped);
}

std::vector<std::filesystem::path> ArtifactWriter::Written() const {
  std::lock_guard<std::mutex> lk(mu_);
  return written_;
}
