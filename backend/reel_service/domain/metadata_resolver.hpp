#pragma once
#include <expected>
#include <string>
#include "domain/download_error.hpp"
#include "domain/video_info.hpp"

namespace reel_service {
class MetadataResolver {
public:
  virtual ~MetadataResolver() = default;
  virtual std::expected<VideoInfo, DownloadError> resolve(const std::string& reel_url) = 0;
};
}
