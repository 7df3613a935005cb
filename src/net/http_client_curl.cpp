#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {
  size_t AppendBody(char* data, size_t size, size_t count, void* target) {
    static_cast<std::string*>(target)->append(data, size * count);
    return size * count;
  }

  struct EasyHandleDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
  };
  struct HeaderListDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
  };
  using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
  using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

  // One handle per worker thread so keep-alive connections to the RPC node are reused
  CURL* ThreadHandle() {
    thread_local EasyHandle handle(curl_easy_init());
    if (handle) curl_easy_reset(handle.get());
    return handle.get();
  }
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    static std::once_flag init;
    std::call_once(init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    CURL* curl = ThreadHandle();
    if (!curl) {
      resp.error = "curl_easy_init failed";
      Logger::Error(resp.error);
      return resp;
    }
    HeaderList header_list;
    bool has_content_type = false;
    for (const auto& kv : headers) {
      if (kv.first == "Content-Type") has_content_type = true;
      std::string line = kv.first + ": " + kv.second;
      header_list.reset(curl_slist_append(header_list.release(), line.c_str()));
    }
    if (!has_content_type) header_list.reset(curl_slist_append(header_list.release(), "Content-Type: application/json"));

    std::string received;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &received);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "multipool-swap/1.0");
    if (tuning_.enable_tcp_keepalive) {
      curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
      curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
      curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    }
    if (tuning_.enable_http2) curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = std::string("POST ") + url + " failed: " + curl_easy_strerror(rc);
      Logger::Warning(resp.error);
      return resp;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(received);
    return resp;
  }

private:
  HttpClientTuning tuning_;
};

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return std::unique_ptr<HttpClient>(new CurlHttpClient(tuning));
}
