#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include "application/url_validator.hpp"
#include "domain/download_error.hpp"
#include "domain/media_fetcher.hpp"
#include "domain/metadata_resolver.hpp"
#include "domain/video_info.hpp"

namespace reel_service {

struct DownloadResult {
  VideoInfo info;
  MediaPayload media;
};

// Validates the reel URL, resolves it to a media URL and fetches the bytes.
// Content type is checked later, when the response is assembled.
class ReelDownloadService {
public:
  ReelDownloadService(std::shared_ptr<MetadataResolver> resolver,
                      std::shared_ptr<MediaFetcher> fetcher);

  std::expected<DownloadResult, DownloadError> download(
    const std::optional<std::string>& url
  );

private:
  UrlValidator validator_;
  std::shared_ptr<MetadataResolver> resolver_;
  std::shared_ptr<MediaFetcher> fetcher_;
};
}
