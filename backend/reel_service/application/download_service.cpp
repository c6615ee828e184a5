#include "download_service.hpp"
#include <spdlog/spdlog.h>

namespace reel_service {
ReelDownloadService::ReelDownloadService(std::shared_ptr<MetadataResolver> resolver,
                                         std::shared_ptr<MediaFetcher> fetcher)
  : resolver_(resolver),
    fetcher_(fetcher) {}

std::expected<DownloadResult, DownloadError> ReelDownloadService::download(
  const std::optional<std::string>& url
) {
  if (!url || url->empty()) {
    return std::unexpected(DownloadError{ErrorKind::kMissingUrl, "URL parameter is required"});
  }

  auto reel_id = validator_.reelId(*url);
  if (!reel_id) {
    return std::unexpected(DownloadError{ErrorKind::kInvalidUrl, "Invalid Instagram reel URL format"});
  }

  spdlog::info("Processing download request url={}", *url);

  auto resolved = resolver_->resolve(*url);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }

  VideoInfo info = std::move(resolved.value());
  if (!info.valid()) {
    spdlog::error("Invalid video info response status='{}' videoUrl='{}'", info.status, info.video_url);
    return std::unexpected(DownloadError{
      ErrorKind::kResolution,
      "Invalid video info response: status '" + info.status + "'" +
        (info.video_url.empty() ? ", missing videoUrl" : "")
    });
  }

  if (info.filename.empty()) {
    info.filename = *reel_id + ".mp4";
  }

  auto media = fetcher_->fetch(info.video_url);
  if (!media) {
    return std::unexpected(media.error());
  }

  return DownloadResult{std::move(info), std::move(media.value())};
}

}
