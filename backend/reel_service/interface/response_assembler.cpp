#include "response_assembler.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace reel_service {

namespace {
constexpr const char* kDefaultFilename = "video.mp4";
constexpr const char* kCacheControl = "public, max-age=3600";
}

bool isVideoContentType(std::string_view content_type) {
  std::string lowered(content_type);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered.find("video") != std::string::npos;
}

std::string sanitizeFilename(std::string_view filename) {
  std::string cleaned;
  cleaned.reserve(filename.size());
  for (char c : filename) {
    if (!std::iscntrl(static_cast<unsigned char>(c))) {
      cleaned += c;
    }
  }
  return cleaned;
}

std::expected<http::response<http::string_body>, DownloadError> assembleVideoResponse(
  MediaPayload&& media, const std::string& filename) {

  if (!isVideoContentType(media.content_type)) {
    spdlog::error("Invalid content type contentType='{}'", media.content_type);
    return std::unexpected(DownloadError{
      ErrorKind::kInvalidContentType,
      "Upstream returned content type '" + media.content_type + "'"
    });
  }

  auto name = sanitizeFilename(filename);
  if (name.empty()) {
    name = kDefaultFilename;
  }

  http::response<http::string_body> res{http::status::ok, 11};
  res.set(http::field::content_type, media.content_type);
  res.set(http::field::content_disposition, "attachment; filename=" + name);
  res.set(http::field::accept_ranges, "bytes");
  res.set(http::field::cache_control, kCacheControl);
  res.body() = std::move(media.data);
  res.prepare_payload();
  return res;
}

}
