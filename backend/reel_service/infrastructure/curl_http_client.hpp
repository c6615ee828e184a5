#pragma once
#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <curl/curl.h>
#include "domain/http_transport.hpp"

namespace reel_service {

// HttpTransport on libcurl. Every call uses its own easy handle, so one
// instance is safe to share between concurrent requests.
class CurlHttpClient : public HttpTransport {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  std::expected<HttpResponse, std::string> get(const HttpRequest& request) override;

  // State shared with the libcurl callbacks during one transfer.
  struct Transfer {
    std::string body;
    std::map<std::string, std::string> headers;
    std::size_t max_body_size{0};
    bool size_exceeded{false};
  };

  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

}
