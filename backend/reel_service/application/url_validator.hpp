#pragma once
#include <optional>
#include <regex>
#include <string>

namespace reel_service {

// Accepts https://[www.]instagram.com/reel/<id> where <id> is [A-Za-z0-9_-]+,
// optionally followed by a trailing slash and a query string or fragment.
class UrlValidator {
public:
  UrlValidator();

  bool isValid(const std::string& url) const;

  // Reel id of a valid URL, nullopt otherwise.
  std::optional<std::string> reelId(const std::string& url) const;

private:
  std::regex pattern_;
};

}
