#pragma once
#include <memory>
#include <optional>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  // verbose_errors exposes exception details in error bodies (development mode).
  explicit RestApiHandlerBase(bool verbose_errors) : verbose_errors_(verbose_errors) {}
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, HEAD, PUT, PATCH, POST, DELETE");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
    };

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::no_content, req.version()};
      addCorsHeaders(res);
      res.keep_alive(req.keep_alive());
      res.prepare_payload();
      return res;
    }

    unsigned version = req.version();
    bool keep_alive = req.keep_alive();
    bool head = req.method() == http::verb::head;
    std::string target(req.target());

    try {
      auto response = doHandleRequest(std::move(req));
      addCorsHeaders(response);
      response.version(version);
      response.keep_alive(keep_alive);
      if (head) {
        stripBody(response);
      }
      return response;
    } catch (const std::exception& e) {
      spdlog::error("Unhandled error: error={} path={}", e.what(), target);
      std::optional<std::string> message;
      if (verbose_errors_) {
        message = e.what();
      }
      auto response = createErrorResponse(http::status::internal_server_error,
                                          "Something went wrong", message);
      addCorsHeaders(response);
      response.version(version);
      response.keep_alive(keep_alive);
      if (head) {
        stripBody(response);
      }
      return response;
    }
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  // Body is {"error": error, "message": message}; message is omitted when empty.
  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& error,
    const std::optional<std::string>& message = std::nullopt);

  bool verboseErrors() const { return verbose_errors_; }

private:
  // HEAD answers carry the GET headers, Content-Length included, and no body.
  static void stripBody(http::response<http::string_body>& response) {
    auto length = response.body().size();
    response.body().clear();
    response.content_length(length);
  }

  bool verbose_errors_;
};

}
