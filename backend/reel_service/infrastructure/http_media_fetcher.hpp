#pragma once
#include <expected>
#include <memory>
#include <string>
#include "common/config/config.hpp"
#include "domain/http_transport.hpp"
#include "domain/media_fetcher.hpp"

namespace reel_service {
class HttpMediaFetcher : public MediaFetcher {
public:
  HttpMediaFetcher(std::shared_ptr<HttpTransport> transport,
                   const config::FetcherConfig& cfg,
                   std::string user_agent);

  std::expected<MediaPayload, DownloadError> fetch(const std::string& video_url) override;

private:
  std::shared_ptr<HttpTransport> transport_;
  std::chrono::milliseconds timeout_;
  std::size_t max_content_length_;
  std::string user_agent_;
};
}
