#include "rest_api_handler.hpp"
#include "interface/response_assembler.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace reel_service {

namespace {

struct ErrorShape {
  http::status status;
  const char *error;
};

ErrorShape errorShape(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kMissingUrl:
    return {http::status::bad_request, "URL parameter is required"};
  case ErrorKind::kInvalidUrl:
    return {http::status::bad_request, "Invalid Instagram reel URL format"};
  case ErrorKind::kResolution:
    return {http::status::bad_request, "Failed to get video URL from API"};
  case ErrorKind::kInvalidContentType:
    return {http::status::bad_request, "Invalid video content type"};
  case ErrorKind::kFetch:
  case ErrorKind::kUnexpected:
    break;
  }
  return {http::status::internal_server_error, "Internal server error"};
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<ReelDownloadService> download_service,
                               std::shared_ptr<Clock> clock,
                               bool verbose_errors)
    : common::RestApiHandlerBase(verbose_errors),
      download_service_(download_service), clock_(clock) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto target = common::parseTarget(std::string(req.target()));

  bool readable = req.method() == http::verb::get || req.method() == http::verb::head;

  if (target.path == "/download" && readable) {
    return handleDownload(target);
  } else if (target.path == "/health" && readable) {
    return handleHealth();
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

http::response<http::string_body>
RestApiHandler::handleDownload(const common::RequestTarget &target) {
  auto start = clock_->now();
  auto elapsed = [this, start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - start).count();
  };

  auto url = target.param("url");

  try {
    auto result = download_service_->download(url);
    if (!result) {
      spdlog::warn("Download failed: kind={} error={} processingTime={}ms",
                   toString(result.error().kind), result.error().message, elapsed());
      return createDownloadErrorResponse(result.error());
    }

    auto response = assembleVideoResponse(std::move(result->media), result->info.filename);
    if (!response) {
      spdlog::warn("Download failed: kind={} error={} processingTime={}ms",
                   toString(response.error().kind), response.error().message, elapsed());
      return createDownloadErrorResponse(response.error());
    }

    spdlog::info("Download completed processingTime={}ms contentLength={}",
                 elapsed(), response->body().size());
    return std::move(response.value());
  } catch (const std::exception &e) {
    spdlog::error("Download error: url={} error={} processingTime={}ms",
                  url.value_or(""), e.what(), elapsed());
    return createDownloadErrorResponse(DownloadError{ErrorKind::kUnexpected, e.what()});
  }
}

http::response<http::string_body> RestApiHandler::handleHealth() {
  nlohmann::json response_json = {{"status", "healthy"}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::createDownloadErrorResponse(const DownloadError &error) {
  auto shape = errorShape(error.kind);

  std::optional<std::string> message;
  switch (error.kind) {
  case ErrorKind::kMissingUrl:
  case ErrorKind::kInvalidUrl:
    break;
  case ErrorKind::kFetch:
  case ErrorKind::kUnexpected:
    message = verboseErrors() ? error.message : "Failed to process video download";
    break;
  default:
    if (verboseErrors()) {
      message = error.message;
    }
    break;
  }

  return createErrorResponse(shape.status, shape.error, message);
}

} // namespace reel_service
