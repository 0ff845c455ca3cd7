#pragma once

#include <string>
#include <utility>
#include <vector>

namespace fleet::util {

struct HttpRequest {
  std::string                                      method = "GET";
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
  long                                             timeout_ms = 10000;
};

/*
  Outcome of one HTTP exchange.

  transport_ok == false means no HTTP status was received
  (DNS, connect, TLS or timeout failure).
*/
struct HttpResponse {
  bool        transport_ok = false;
  bool        timed_out    = false;
  long        status       = 0;
  std::string body;
  std::string error;

  bool Ok() const {
    return transport_ok && status >= 200 && status < 300;
  }
};

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;

  // Plain TCP connect, used as a reachability check.
  virtual bool CanConnect(const std::string& host, int port, long timeout_ms) = 0;
};

/*
  libcurl easy-handle implementation. One handle per call, so a single
  instance is safe to share between threads.
*/
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  HttpResponse Send(const HttpRequest& request) override;
  bool         CanConnect(const std::string& host, int port, long timeout_ms) override;
};

} // namespace fleet::util
