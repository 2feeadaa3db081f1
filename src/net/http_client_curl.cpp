#include "net/http_client.hpp"
#include <curl/curl.h>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlHttpClient() override {
    curl_global_cleanup();
  }
  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    CURL* curl = curl_easy_init();
    if (!curl) { resp.error = "curl_easy_init failed"; return resp; }
    std::string response_string;
    struct curl_slist* header_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    if (tuning_.enable_http2) curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS));
    if (!tuning_.verify_tls) {
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = std::string("curl_easy_perform failed: ") + curl_easy_strerror(rc);
    } else {
      long code = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
      resp.status = code;
      resp.body = std::move(response_string);
    }
    if (header_list) curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return resp;
  }
private:
  HttpClientTuning tuning_;
};

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return std::unique_ptr<HttpClient>(new CurlHttpClient(tuning));
}
