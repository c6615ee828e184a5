#pragma once
#include <expected>
#include <string>
#include "domain/download_error.hpp"
#include "domain/video_info.hpp"

namespace reel_service {
class MediaFetcher {
public:
  virtual ~MediaFetcher() = default;
  virtual std::expected<MediaPayload, DownloadError> fetch(const std::string& video_url) = 0;
};
}
