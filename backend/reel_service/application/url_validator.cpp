#include "url_validator.hpp"

namespace reel_service {

namespace {
// Longer inputs are never reel links and only cost regex time.
constexpr std::size_t kMaxUrlLength = 2048;
}

UrlValidator::UrlValidator()
  : pattern_("^https://(?:www\\.)?instagram\\.com/reel/([A-Za-z0-9_-]+)/?(?:[?#].*)?$") {}

bool UrlValidator::isValid(const std::string& url) const {
  return reelId(url).has_value();
}

std::optional<std::string> UrlValidator::reelId(const std::string& url) const {
  if (url.empty() || url.size() > kMaxUrlLength) {
    return std::nullopt;
  }

  try {
    std::smatch match;
    if (!std::regex_match(url, match, pattern_)) {
      return std::nullopt;
    }
    return match[1].str();
  } catch (const std::regex_error&) {
    return std::nullopt;
  }
}

}
