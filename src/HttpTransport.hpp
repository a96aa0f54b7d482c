#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "Config.hpp"
#include "HttpResponse.hpp"
#include "UAgent.hpp"
#include "URL.hpp"

// Limits observed by a single request.
struct FetchControl {
  std::chrono::milliseconds timeout{Config::kDefaultFetchTimeout};
  // overall run deadline; the effective timeout never extends past it
  std::chrono::steady_clock::time_point deadline{
    std::chrono::steady_clock::time_point::max()};
  const std::atomic<bool>* cancelled{nullptr};

  bool IsCancelled() const {
    return cancelled != nullptr && cancelled->load();
  }
};

// Seam between the fetcher and the network. Never throws for transport
// failures; they are reported through HttpResponse::GetError().
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse Get(const URL& url, const FetchControl& ctl) = 0;
};

class CurlTransport : public HttpTransport {
 public:
  explicit CurlTransport(const RunConfig& conf);

  HttpResponse Get(const URL& url, const FetchControl& ctl) override;

 private:
  static size_t WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                  void* userdata);
  static size_t WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                    void* userdata);
  static int ProgressCallback(void* clientp, long long dltotal, long long dlnow,
                              long long ultotal, long long ulnow);

  UAgent agent_;
  std::chrono::milliseconds connect_timeout_;
};
