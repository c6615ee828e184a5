#pragma once
#include <expected>
#include <memory>
#include <string>
#include "application/retry_policy.hpp"
#include "common/config/config.hpp"
#include "domain/clock.hpp"
#include "domain/http_transport.hpp"
#include "domain/metadata_resolver.hpp"

namespace reel_service {

// Resolves a reel URL through the upstream JSON API
// (GET <endpoint>?url=<reel url> -> {status, data: {videoUrl, filename}}).
class ApiMetadataResolver : public MetadataResolver {
public:
  ApiMetadataResolver(std::shared_ptr<HttpTransport> transport,
                      std::shared_ptr<Clock> clock,
                      const config::ResolverConfig& cfg,
                      std::string user_agent);

  std::expected<VideoInfo, DownloadError> resolve(const std::string& reel_url) override;

  std::string buildRequestUrl(const std::string& reel_url) const;

private:
  // Final response of the retry loop, whatever its status.
  std::expected<HttpResponse, std::string> getWithRetry(const HttpRequest& request);
  std::expected<VideoInfo, std::string> parseVideoInfo(const HttpResponse& response) const;

  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<Clock> clock_;
  std::string endpoint_;
  std::chrono::milliseconds timeout_;
  RetryPolicy retry_policy_;
  std::string user_agent_;
};

}
