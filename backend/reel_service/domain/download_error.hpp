#pragma once
#include <string>
#include <string_view>

namespace reel_service {

enum class ErrorKind {
  kMissingUrl,
  kInvalidUrl,
  kResolution,
  kFetch,
  kInvalidContentType,
  kUnexpected
};

struct DownloadError {
  ErrorKind kind;
  std::string message;
};

inline std::string_view toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMissingUrl: return "missing_url";
    case ErrorKind::kInvalidUrl: return "invalid_url";
    case ErrorKind::kResolution: return "resolution";
    case ErrorKind::kFetch: return "fetch";
    case ErrorKind::kInvalidContentType: return "invalid_content_type";
    case ErrorKind::kUnexpected: return "unexpected";
  }
  return "unknown";
}

} // namespace reel_service
