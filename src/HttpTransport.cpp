#include "HttpTransport.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <curl/curl.h>
#include <memory>

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* c) const {
    curl_easy_cleanup(c);
  }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

UAgent MakeAgent(const RunConfig& conf) {
  if (conf.user_agent_list.empty())
    return UAgent{};
  return UAgent{conf.user_agent_list, conf.SiteKey()};
}
}  // namespace

CurlTransport::CurlTransport(const RunConfig& conf)
    : agent_{MakeAgent(conf)}, connect_timeout_{conf.connect_timeout} {
}

HttpResponse CurlTransport::Get(const URL& url, const FetchControl& ctl) {
  HttpResponse resp;

  using clock = std::chrono::steady_clock;
  auto timeout = ctl.timeout;
  if (ctl.deadline != clock::time_point::max()) {
    auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(ctl.deadline -
                                                            clock::now());
    timeout = std::min(timeout, remaining);
  }
  if (timeout.count() <= 0) {
    resp.SetError("run deadline reached before request", true);
    return resp;
  }
  if (ctl.IsCancelled()) {
    resp.SetError("cancelled");
    return resp;
  }

  CurlEasy curl{curl_easy_init()};
  if (!curl) {
    logr::warning << "[CurlTransport] failed to init CURL";
    resp.SetError("curl_easy_init failed");
    return resp;
  }
  CURL* h = curl.get();

  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);  // thread-safe timeouts on *nix
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(std::min(connect_timeout_, timeout).count()));
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);

  curl_easy_setopt(h, CURLOPT_USERAGENT, agent_.Get().c_str());
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());

  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(h, CURLOPT_AUTOREFERER, 1L);
  curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

  // Auto-decompress gzip/br (server dependent)
  curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);

  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteBodyCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, WriteHeaderCallback);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp);

  // user abort stops the transfer at the next progress tick
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<FetchControl*>(&ctl));

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

  CURLcode code = curl_easy_perform(h);

  if (code == CURLE_HTTP2_STREAM || code == CURLE_HTTP2) {
    logr::warning << "[CurlTransport] HTTP/2 error; retry HTTP/1.1 for: "
                  << url;
    resp = HttpResponse{};
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp);
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    errbuf[0] = '\0';
    code = curl_easy_perform(h);
  }

  long http_code = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);
  resp.SetStatusCode(http_code);

  char* effective_url = nullptr;
  curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective_url);
  resp.SetEffectiveUrl(effective_url != nullptr ? effective_url
                                                : url.ToString());

  if (code != CURLE_OK) {
    std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(code);
    if (code == CURLE_ABORTED_BY_CALLBACK)
      detail = "cancelled";
    resp.SetError(detail, code == CURLE_OPERATION_TIMEDOUT);
    logr::debug << "[CurlTransport] " << url << ": " << detail;
  } else if (!resp.IsOkay()) {
    resp.SetError("HTTP " + std::to_string(http_code));
  }

  return resp;
}

size_t CurlTransport::WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                        void* userdata) {
  auto* resp = static_cast<HttpResponse*>(userdata);
  resp->AppendBody(ptr, size * nmemb);
  return size * nmemb;
}

size_t CurlTransport::WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                          void* userdata) {
  auto* resp = static_cast<HttpResponse*>(userdata);
  // ptr may include the "\r\n" at the end
  std::string line(ptr, size * nmemb);
  resp->AddHeaderLine(line);
  return size * nmemb;
}

int CurlTransport::ProgressCallback(void* clientp, long long, long long,
                                    long long, long long) {
  auto* ctl = static_cast<const FetchControl*>(clientp);
  return ctl->IsCancelled() ? 1 : 0;
}
