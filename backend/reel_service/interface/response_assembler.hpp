#pragma once
#include <expected>
#include <string>
#include <string_view>
#include <boost/beast/http.hpp>
#include "domain/download_error.hpp"
#include "domain/video_info.hpp"

namespace http = boost::beast::http;

namespace reel_service {

bool isVideoContentType(std::string_view content_type);

// Drops control characters so the name cannot break the header line.
std::string sanitizeFilename(std::string_view filename);

// 200 response carrying the video bytes as an attachment.
std::expected<http::response<http::string_body>, DownloadError> assembleVideoResponse(
  MediaPayload&& media, const std::string& filename);

}
