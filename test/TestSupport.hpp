#pragma once

// Fakes for the network, analyzer and filesystem seams shared by the tests.

#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <png.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "AuditRunner.hpp"
#include "Errors.hpp"
#include "HttpTransport.hpp"

// Serves canned responses by exact URL text; anything else is a 404.
class FakeTransport : public HttpTransport {
 public:
  void Serve(const std::string& url, const std::string& body,
             const std::string& content_type, long status = 200) {
    std::lock_guard<std::mutex> lk(mu_);
    routes_[url] = Route{body, content_type, status, false, ""};
  }

  void TimeOut(const std::string& url) {
    std::lock_guard<std::mutex> lk(mu_);
    routes_[url] = Route{"", "", 0, true, ""};
  }

  void Redirect(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lk(mu_);
    routes_[from] = Route{"", "", 200, false, to};
  }

  // Every Get sleeps this long outside the lock, so calls overlap.
  void Delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mu_);
    delay_ = delay;
  }

  HttpResponse Get(const URL& url, const FetchControl&) override {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lk(mu_);
      peak_ = std::max(peak_, ++in_flight_);
      delay = delay_;
    }
    if (delay.count() > 0)
      std::this_thread::sleep_for(delay);
    HttpResponse resp = Respond(url);
    std::lock_guard<std::mutex> lk(mu_);
    --in_flight_;
    return resp;
  }

  int Hits(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hits_.find(url);
    return it == hits_.end() ? 0 : it->second;
  }

  // Most Get calls ever running at once.
  int PeakInFlight() const {
    std::lock_guard<std::mutex> lk(mu_);
    return peak_;
  }

 private:
  HttpResponse Respond(const URL& url) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string key = url.ToString();
    ++hits_[key];
    HttpResponse resp;
    auto it = routes_.find(key);
    if (it == routes_.end()) {
      resp.SetStatusCode(404);
      resp.SetEffectiveUrl(key);
      return resp;
    }
    Route route = it->second;
    std::string effective = key;
    if (!route.redirect.empty()) {
      effective = route.redirect;
      route = routes_.at(route.redirect);
    }
    if (route.timeout) {
      resp.SetError("Operation timed out", true);
      return resp;
    }
    resp.SetStatusCode(route.status);
    resp.SetEffectiveUrl(effective);
    resp.AddHeaderLine("HTTP/1.1 " + std::to_string(route.status) + " OK");
    resp.AddHeaderLine("Content-Type: " + route.content_type);
    resp.AppendBody(route.body.data(), route.body.size());
    return resp;
  }

  struct Route {
    std::string body;
    std::string content_type;
    long status;
    bool timeout;
    std::string redirect;
  };

  mutable std::mutex mu_;
  std::map<std::string, Route> routes_;
  std::map<std::string, int> hits_;
  std::chrono::milliseconds delay_{0};
  int in_flight_{0};
  int peak_{0};
};

// A Lighthouse-shaped report with the fields the normalizer reads.
inline nlohmann::json LighthouseReport(double score, double lcp, double cls,
                                       double tbt, double tti, double fcp) {
  auto audit = [](double v) {
    return nlohmann::json{{"numericValue", v}, {"score", 1.0}};
  };
  return nlohmann::json{
    {"categories", {{"performance", {{"score", score}}}}},
    {"audits",
     {{"largest-contentful-paint", audit(lcp)},
      {"cumulative-layout-shift", audit(cls)},
      {"total-blocking-time", audit(tbt)},
      {"interactive", audit(tti)},
      {"first-contentful-paint", audit(fcp)}}}};
}

// Answers each Analyze() call with the next scripted reply.
class FakeAnalyzer : public Analyzer {
 public:
  using Reply = std::function<nlohmann::json(const std::string&)>;

  void Then(Reply reply) {
    replies_.push_back(std::move(reply));
  }
  void ThenReport(nlohmann::json report) {
    Then([report](const std::string&) { return report; });
  }
  void ThenUnavailable(const std::string& why) {
    Then([why](const std::string&) -> nlohmann::json {
      throw AuditUnavailableError(why);
    });
  }

  nlohmann::json Analyze(const std::string& target) override {
    targets_.push_back(target);
    if (replies_.empty())
      throw AuditUnavailableError("no scripted reply");
    Reply reply = replies_.front();
    replies_.erase(replies_.begin());
    return reply(target);
  }

  const std::vector<std::string>& Targets() const {
    return targets_;
  }

 private:
  std::vector<Reply> replies_;
  std::vector<std::string> targets_;
};

// Fresh directory under the system temp dir, removed afterwards.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("pagelift-test-" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

// Uncompressed RGBA PNG; every pixel opaque unless `alpha` says otherwise.
inline std::string MakePng(int width, int height, png_byte alpha = 0xFF) {
  struct Sink {
    static void Write(png_structp png, png_bytep data, png_size_t len) {
      auto* out = static_cast<std::string*>(png_get_io_ptr(png));
      out->append(reinterpret_cast<const char*>(data), len);
    }
    static void Flush(png_structp) {
    }
  };

  std::string out;
  png_structp png =
    png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  png_infop info = png_create_info_struct(png);
  std::vector<png_byte> row(static_cast<size_t>(width) * 4);
  for (int x = 0; x < width; ++x) {
    row[x * 4 + 0] = static_cast<png_byte>(x * 7);
    row[x * 4 + 1] = 0x40;
    row[x * 4 + 2] = 0x80;
    row[x * 4 + 3] = alpha;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    throw std::runtime_error("MakePng failed");
  }
  png_set_write_fn(png, &out, &Sink::Write, &Sink::Flush);
  png_set_compression_level(png, 0);
  png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGBA,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  for (int y = 0; y < height; ++y)
    png_write_row(png, row.data());
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
  return out;
}

// Signature, IHDR and an empty IDAT chunk header: claims a size without
// carrying any pixels.
inline std::string MakePngHeader(png_uint_32 width, png_uint_32 height) {
  struct Sink {
    static void Write(png_structp png, png_bytep data, png_size_t len) {
      auto* out = static_cast<std::string*>(png_get_io_ptr(png));
      out->append(reinterpret_cast<const char*>(data), len);
    }
    static void Flush(png_structp) {
    }
  };

  std::string out;
  png_structp png =
    png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  png_infop info = png_create_info_struct(png);
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    throw std::runtime_error("MakePngHeader failed");
  }
  png_set_write_fn(png, &out, &Sink::Write, &Sink::Flush);
  png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGBA,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  png_destroy_write_struct(&png, &info);
  out.append(std::string("\0\0\0\0IDAT", 8));
  return out;
}

// Baseline JPEG of a horizontal gradient.
inline std::string MakeJpeg(int width, int height, int quality = 90) {
  jpeg_compress_struct cinfo;
  jpeg_error_mgr jerr;
  cinfo.err = jpeg_std_error(&jerr);
  jpeg_create_compress(&cinfo);
  unsigned char* buf = nullptr;
  unsigned long size = 0;
  jpeg_mem_dest(&cinfo, &buf, &size);
  cinfo.image_width = static_cast<JDIMENSION>(width);
  cinfo.image_height = static_cast<JDIMENSION>(height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);
  std::vector<JSAMPLE> row(static_cast<size_t>(width) * 3);
  for (int x = 0; x < width; ++x) {
    row[x * 3 + 0] = static_cast<JSAMPLE>(x * 255 / (width > 1 ? width - 1 : 1));
    row[x * 3 + 1] = 0x60;
    row[x * 3 + 2] = 0xA0;
  }
  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW rows[1] = {row.data()};
    jpeg_write_scanlines(&cinfo, rows, 1);
  }
  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);
  std::string out(reinterpret_cast<const char*>(buf), size);
  free(buf);
  return out;
}
