#include "interface/rest_api_handler.hpp"
#include "infrastructure/api_metadata_resolver.hpp"
#include "infrastructure/http_media_fetcher.hpp"
#include "common/restful/query_string.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace reel_service {
namespace {

using testing::FakeClock;
using testing::FakeTransport;
using testing::makeResponse;

constexpr const char* kReelUrl = "https://www.instagram.com/reel/ABC123";
constexpr const char* kResolverEndpoint = "https://resolver.example/";
constexpr const char* kVideoUrl = "https://x/video.mp4";
constexpr const char* kSuccessBody =
  R"({"status":"success","data":{"videoUrl":"https://x/video.mp4","filename":"v.mp4"}})";

class ThrowingFetcher : public MediaFetcher {
public:
  std::expected<MediaPayload, DownloadError> fetch(const std::string&) override {
    throw std::runtime_error("fetcher exploded");
  }
};

http::request<http::string_body> makeRequest(http::verb method, const std::string& target) {
  http::request<http::string_body> req{method, target, 11};
  req.set(http::field::host, "localhost");
  return req;
}

std::string downloadTarget(const std::string& url) {
  return "/download?url=" + common::percentEncode(url);
}

class RestApiHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_->setResponder([this](const HttpRequest& request) -> FakeTransport::Result {
      if (request.url.starts_with(kResolverEndpoint)) {
        ++resolver_calls_;
        if (!resolver_script_.empty()) {
          auto next = resolver_script_.front();
          resolver_script_.erase(resolver_script_.begin());
          return next;
        }
        return resolver_default_;
      }
      if (request.url == kVideoUrl) {
        ++fetch_calls_;
        return media_response_;
      }
      return std::unexpected("unexpected url " + request.url);
    });
  }

  std::shared_ptr<RestApiHandler> makeHandler(bool verbose_errors,
                                              std::shared_ptr<MediaFetcher> fetcher = nullptr) {
    config::ResolverConfig resolver_cfg{
      .endpoint = kResolverEndpoint,
      .timeout = std::chrono::milliseconds(15000),
      .max_attempts = 3,
      .retry_delay = std::chrono::milliseconds(1000),
      .retry_status_codes = {408, 429}
    };
    config::FetcherConfig fetcher_cfg{
      .timeout = std::chrono::milliseconds(30000),
      .max_content_length = 100 * 1024 * 1024
    };
    auto resolver = std::make_shared<ApiMetadataResolver>(transport_, clock_, resolver_cfg, "TestAgent/1.0");
    if (!fetcher) {
      fetcher = std::make_shared<HttpMediaFetcher>(transport_, fetcher_cfg, "TestAgent/1.0");
    }
    auto service = std::make_shared<ReelDownloadService>(resolver, fetcher);
    return std::make_shared<RestApiHandler>(service, clock_, verbose_errors);
  }

  http::response<http::string_body> get(RestApiHandler& handler, const std::string& target) {
    return handler.handleRequest(makeRequest(http::verb::get, target));
  }

  static nlohmann::json jsonBody(const http::response<http::string_body>& response) {
    return nlohmann::json::parse(response.body());
  }

  std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
  std::shared_ptr<FakeClock> clock_ = std::make_shared<FakeClock>();

  std::vector<FakeTransport::Result> resolver_script_;
  FakeTransport::Result resolver_default_ = makeResponse(200, "application/json", kSuccessBody);
  FakeTransport::Result media_response_ = makeResponse(200, "video/mp4", std::string("\x00\x01video\xff", 8));
  int resolver_calls_ = 0;
  int fetch_calls_ = 0;
};

TEST_F(RestApiHandlerTest, MissingUrlIsBadRequest) {
  auto handler = makeHandler(false);
  auto response = get(*handler, "/download");

  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_NE(std::string(response.at(http::field::content_type)).find("json"), std::string::npos);
  EXPECT_EQ(jsonBody(response)["error"], "URL parameter is required");
  EXPECT_TRUE(transport_->requests.empty());
}

TEST_F(RestApiHandlerTest, EmptyUrlIsBadRequest) {
  auto handler = makeHandler(false);
  auto response = get(*handler, "/download?url=");

  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_EQ(jsonBody(response)["error"], "URL parameter is required");
}

TEST_F(RestApiHandlerTest, MalformedUrlIsBadRequest) {
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget("https://www.instagram.com/not-a-reel/x"));

  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_EQ(jsonBody(response)["error"], "Invalid Instagram reel URL format");
  EXPECT_TRUE(transport_->requests.empty());
}

TEST_F(RestApiHandlerTest, HtmlResolverResponseIsResolutionError) {
  resolver_default_ = makeResponse(200, "text/html", "<html><body>Oops</body></html>");
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget(kReelUrl));

  EXPECT_EQ(response.result(), http::status::bad_request);
  auto body = jsonBody(response);
  EXPECT_EQ(body["error"], "Failed to get video URL from API");
  EXPECT_FALSE(body.contains("message"));
  EXPECT_EQ(resolver_calls_, 1);
  EXPECT_EQ(fetch_calls_, 0);
}

TEST_F(RestApiHandlerTest, NonSuccessStatusIsResolutionError) {
  resolver_default_ = makeResponse(200, "application/json",
                                   R"({"status":"error","data":{"videoUrl":"https://x/video.mp4"}})");
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget(kReelUrl));

  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_EQ(jsonBody(response)["error"], "Failed to get video URL from API");
  EXPECT_EQ(fetch_calls_, 0);
}

TEST_F(RestApiHandlerTest, StreamsVideoOnSuccess) {
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget(kReelUrl));

  ASSERT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(response.at(http::field::content_type), "video/mp4");
  EXPECT_EQ(response.at(http::field::content_length), "8");
  EXPECT_EQ(response.at(http::field::content_disposition), "attachment; filename=v.mp4");
  EXPECT_EQ(response.at(http::field::accept_ranges), "bytes");
  EXPECT_EQ(response.at(http::field::cache_control), "public, max-age=3600");
  EXPECT_EQ(response.at(http::field::access_control_allow_origin), "*");
  EXPECT_EQ(response.body(), std::string("\x00\x01video\xff", 8));
  EXPECT_EQ(resolver_calls_, 1);
  EXPECT_EQ(fetch_calls_, 1);
}

TEST_F(RestApiHandlerTest, NonVideoContentTypeIsRejected) {
  media_response_ = makeResponse(200, "text/plain", "not a video");
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget(kReelUrl));

  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_EQ(jsonBody(response)["error"], "Invalid video content type");
}

TEST_F(RestApiHandlerTest, RepeatedRequestsAreIdentical) {
  auto handler = makeHandler(false);
  auto first = get(*handler, downloadTarget(kReelUrl));
  auto second = get(*handler, downloadTarget(kReelUrl));

  ASSERT_EQ(first.result(), http::status::ok);
  ASSERT_EQ(second.result(), http::status::ok);
  EXPECT_EQ(first.body(), second.body());
  for (auto field : {http::field::content_type, http::field::content_length,
                     http::field::content_disposition, http::field::accept_ranges,
                     http::field::cache_control}) {
    EXPECT_EQ(first.at(field), second.at(field));
  }
}

TEST_F(RestApiHandlerTest, RecoversAfterTwoUpstreamFailures) {
  resolver_script_ = {makeResponse(500, "text/plain", "down"), makeResponse(502, "text/plain", "down")};
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget(kReelUrl));

  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(resolver_calls_, 3);
  EXPECT_EQ(clock_->sleeps.size(), 2u);
}

TEST_F(RestApiHandlerTest, GivesUpAfterThreeUpstreamFailures) {
  resolver_default_ = makeResponse(500, "text/plain", "down");
  auto handler = makeHandler(false);
  auto response = get(*handler, downloadTarget(kReelUrl));

  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_EQ(jsonBody(response)["error"], "Failed to get video URL from API");
  EXPECT_EQ(resolver_calls_, 3);
  EXPECT_EQ(fetch_calls_, 0);
}

TEST_F(RestApiHandlerTest, FetchFailureIsInternalErrorWithGatedDetail) {
  media_response_ = std::unexpected(std::string("timeout of 30000ms exceeded"));

  auto production = get(*makeHandler(false), downloadTarget(kReelUrl));
  EXPECT_EQ(production.result(), http::status::internal_server_error);
  auto production_body = jsonBody(production);
  EXPECT_EQ(production_body["error"], "Internal server error");
  EXPECT_EQ(production_body["message"], "Failed to process video download");

  auto development = get(*makeHandler(true), downloadTarget(kReelUrl));
  EXPECT_EQ(development.result(), http::status::internal_server_error);
  auto development_body = jsonBody(development);
  EXPECT_EQ(development_body["error"], "Internal server error");
  EXPECT_EQ(development_body["message"], "Failed to fetch video: timeout of 30000ms exceeded");
}

TEST_F(RestApiHandlerTest, OversizedMediaIsInternalError) {
  media_response_ = std::unexpected(std::string("maxContentLength size of 104857600 exceeded"));

  auto response = get(*makeHandler(true), downloadTarget(kReelUrl));
  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_EQ(jsonBody(response)["message"],
            "Failed to fetch video: maxContentLength size of 104857600 exceeded");
}

TEST_F(RestApiHandlerTest, UnexpectedExceptionIsInternalError) {
  auto production = get(*makeHandler(false, std::make_shared<ThrowingFetcher>()), downloadTarget(kReelUrl));
  EXPECT_EQ(production.result(), http::status::internal_server_error);
  auto production_body = jsonBody(production);
  EXPECT_EQ(production_body["error"], "Internal server error");
  EXPECT_EQ(production_body["message"], "Failed to process video download");

  auto development = get(*makeHandler(true, std::make_shared<ThrowingFetcher>()), downloadTarget(kReelUrl));
  EXPECT_EQ(development.result(), http::status::internal_server_error);
  EXPECT_EQ(jsonBody(development)["message"], "fetcher exploded");
}

TEST_F(RestApiHandlerTest, HealthCheck) {
  auto handler = makeHandler(false);
  auto response = get(*handler, "/health");

  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(jsonBody(response), nlohmann::json({{"status", "healthy"}}));
}

TEST_F(RestApiHandlerTest, HeadHealthHasHeadersOnly) {
  auto handler = makeHandler(false);
  auto full = get(*handler, "/health");
  auto head = handler->handleRequest(makeRequest(http::verb::head, "/health"));

  EXPECT_EQ(head.result(), http::status::ok);
  EXPECT_TRUE(head.body().empty());
  EXPECT_EQ(head.at(http::field::content_length), full.at(http::field::content_length));
  EXPECT_EQ(head.at(http::field::content_type), full.at(http::field::content_type));
}

TEST_F(RestApiHandlerTest, HeadDownloadHasHeadersOnly) {
  auto handler = makeHandler(false);
  auto head = handler->handleRequest(makeRequest(http::verb::head, downloadTarget(kReelUrl)));

  EXPECT_EQ(head.result(), http::status::ok);
  EXPECT_TRUE(head.body().empty());
  EXPECT_EQ(head.at(http::field::content_length), "8");
  EXPECT_EQ(head.at(http::field::content_disposition), "attachment; filename=v.mp4");
}

TEST_F(RestApiHandlerTest, UnknownRouteIsNotFound) {
  auto handler = makeHandler(false);

  EXPECT_EQ(get(*handler, "/nope").result(), http::status::not_found);
  auto post = handler->handleRequest(makeRequest(http::verb::post, "/download"));
  EXPECT_EQ(post.result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, AnswersCorsPreflight) {
  auto handler = makeHandler(false);
  auto response = handler->handleRequest(makeRequest(http::verb::options, "/download"));

  EXPECT_EQ(response.result(), http::status::no_content);
  EXPECT_EQ(response.at(http::field::access_control_allow_origin), "*");
  EXPECT_TRUE(transport_->requests.empty());
}

}
}
