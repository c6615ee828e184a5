#pragma once
#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace reel_service {

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds timeout{0};
  std::size_t max_body_size{0};  // 0 means unbounded
};

struct HttpResponse {
  long status{0};
  std::map<std::string, std::string> headers;  // lower-cased names
  std::string body;

  std::string header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
  }
};

// Outbound GET. A returned HttpResponse may carry any status; the error side
// is reserved for transport failures (DNS, connect, timeout, size cap).
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual std::expected<HttpResponse, std::string> get(const HttpRequest& request) = 0;
};

} // namespace reel_service
