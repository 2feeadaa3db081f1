#pragma once
#include <memory>
#include <string>
#include <unordered_map>

// status == 0 means the request never produced an HTTP response
// (DNS, connect, TLS or timeout failure); error then carries the reason.
struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  int connect_timeout_ms = 5000;
  bool verify_tls = true;
};

// libcurl-backed client; one easy handle per request.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
