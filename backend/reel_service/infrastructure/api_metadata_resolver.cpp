#include "api_metadata_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "common/restful/query_string.hpp"

namespace reel_service {

namespace {

constexpr long kHttpOk = 200;
constexpr std::size_t kLoggedBodyLimit = 512;

std::string truncateForLog(const std::string& body) {
  if (body.size() <= kLoggedBodyLimit) {
    return body;
  }
  return body.substr(0, kLoggedBodyLimit) + "...";
}

bool isHtml(std::string content_type) {
  std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return content_type.find("text/html") != std::string::npos;
}

std::string stringField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}

ApiMetadataResolver::ApiMetadataResolver(std::shared_ptr<HttpTransport> transport,
                                         std::shared_ptr<Clock> clock,
                                         const config::ResolverConfig& cfg,
                                         std::string user_agent)
  : transport_(transport),
    clock_(clock),
    endpoint_(cfg.endpoint),
    timeout_(cfg.timeout),
    retry_policy_(RetryPolicy::fromConfig(cfg)),
    user_agent_(std::move(user_agent)) {}

std::string ApiMetadataResolver::buildRequestUrl(const std::string& reel_url) const {
  char separator = endpoint_.find('?') == std::string::npos ? '?' : '&';
  return endpoint_ + separator + "url=" + common::percentEncode(reel_url);
}

std::expected<VideoInfo, DownloadError> ApiMetadataResolver::resolve(const std::string& reel_url) {
  HttpRequest request{
    .url = buildRequestUrl(reel_url),
    .headers = {{"Accept", "application/json"}, {"User-Agent", user_agent_}},
    .timeout = timeout_,
    .max_body_size = 0
  };

  auto fail = [&reel_url](const std::string& cause, const std::string& body) {
    spdlog::error("API Error: url={} error={} response={}", reel_url, cause, truncateForLog(body));
    return std::unexpected(DownloadError{ErrorKind::kResolution, "Failed to fetch video info: " + cause});
  };

  auto response = getWithRetry(request);
  if (!response) {
    return fail(response.error(), "");
  }

  if (response->status != kHttpOk) {
    return fail("Request failed with status code " + std::to_string(response->status), response->body);
  }

  auto info = parseVideoInfo(response.value());
  if (!info) {
    return fail(info.error(), response->body);
  }
  return info.value();
}

std::expected<HttpResponse, std::string> ApiMetadataResolver::getWithRetry(const HttpRequest& request) {
  for (int attempt = 1;; ++attempt) {
    auto response = transport_->get(request);
    if (!response) {
      return response;
    }

    if (response->status == kHttpOk ||
        attempt >= retry_policy_.max_attempts ||
        !retry_policy_.shouldRetry(response->status)) {
      return response;
    }

    spdlog::info("Retry attempt #{} after status {}", attempt, response->status);
    clock_->sleepFor(retry_policy_.delay);
  }
}

std::expected<VideoInfo, std::string> ApiMetadataResolver::parseVideoInfo(const HttpResponse& response) const {
  if (isHtml(response.header("content-type"))) {
    return std::unexpected("API returned HTML instead of JSON");
  }

  auto json = nlohmann::json::parse(response.body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::unexpected("Invalid API response format");
  }

  VideoInfo info;
  info.status = stringField(json, "status");

  auto data = json.find("data");
  if (data != json.end() && data->is_object()) {
    info.video_url = stringField(*data, "videoUrl");
    info.filename = stringField(*data, "filename");
  }
  return info;
}

}
