#include "http_media_fetcher.hpp"
#include <charconv>
#include <system_error>
#include <spdlog/spdlog.h>

namespace reel_service {
HttpMediaFetcher::HttpMediaFetcher(std::shared_ptr<HttpTransport> transport,
                                   const config::FetcherConfig& cfg,
                                   std::string user_agent)
  : transport_(transport),
    timeout_(cfg.timeout),
    max_content_length_(cfg.max_content_length),
    user_agent_(std::move(user_agent)) {}

std::expected<MediaPayload, DownloadError> HttpMediaFetcher::fetch(const std::string& video_url) {
  HttpRequest request{
    .url = video_url,
    .headers = {{"Range", "bytes=0-"}, {"User-Agent", user_agent_}},
    .timeout = timeout_,
    .max_body_size = max_content_length_
  };

  auto fail = [&video_url](const std::string& cause) {
    spdlog::error("Video fetch error: url={} error={}", video_url, cause);
    return std::unexpected(DownloadError{ErrorKind::kFetch, "Failed to fetch video: " + cause});
  };

  auto response = transport_->get(request);
  if (!response) {
    return fail(response.error());
  }

  if (response->status < 200 || response->status > 299) {
    return fail("Request failed with status code " + std::to_string(response->status));
  }

  // Also checked here for transports that ignore max_body_size.
  if (response->body.size() > max_content_length_) {
    return fail("maxContentLength size of " + std::to_string(max_content_length_) + " exceeded");
  }

  MediaPayload payload;
  payload.content_type = response->header("content-type");
  payload.content_length = response->body.size();

  auto announced = response->header("content-length");
  std::size_t announced_length = 0;
  auto [ptr, ec] = std::from_chars(announced.data(), announced.data() + announced.size(), announced_length);
  if (!announced.empty() && (ec != std::errc{} || announced_length != payload.content_length)) {
    spdlog::warn("Content-Length mismatch: url={} announced={} received={}",
                 video_url, announced, payload.content_length);
  }

  payload.data = std::move(response->body);
  return payload;
}
}
