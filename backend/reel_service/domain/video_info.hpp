#pragma once
#include <cstddef>
#include <string>

namespace reel_service {

inline constexpr const char* kResolverSuccessStatus = "success";

// Upstream resolver answer: {status, data: {videoUrl, filename}}.
struct VideoInfo {
  std::string status;
  std::string video_url;
  std::string filename;

  bool valid() const {
    return status == kResolverSuccessStatus && !video_url.empty();
  }
};

struct MediaPayload {
  std::string data;          // raw video bytes
  std::string content_type;
  std::size_t content_length{0};
};

} // namespace reel_service
