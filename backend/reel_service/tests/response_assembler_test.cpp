#include "interface/response_assembler.hpp"
#include <gtest/gtest.h>

namespace reel_service {
namespace {

TEST(ResponseAssemblerTest, SetsDownloadHeaders) {
  auto response = assembleVideoResponse(MediaPayload{"0123456789", "video/mp4", 10}, "v.mp4");
  ASSERT_TRUE(response.has_value());

  EXPECT_EQ(response->result(), http::status::ok);
  EXPECT_EQ(response->at(http::field::content_type), "video/mp4");
  EXPECT_EQ(response->at(http::field::content_length), "10");
  EXPECT_EQ(response->at(http::field::content_disposition), "attachment; filename=v.mp4");
  EXPECT_EQ(response->at(http::field::accept_ranges), "bytes");
  EXPECT_EQ(response->at(http::field::cache_control), "public, max-age=3600");
  EXPECT_EQ(response->body(), "0123456789");
}

TEST(ResponseAssemblerTest, RejectsNonVideoContent) {
  auto response = assembleVideoResponse(MediaPayload{"hello", "text/plain", 5}, "v.mp4");
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error().kind, ErrorKind::kInvalidContentType);

  auto missing = assembleVideoResponse(MediaPayload{"hello", "", 5}, "v.mp4");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::kInvalidContentType);
}

TEST(ResponseAssemblerTest, AcceptsVideoSubtypes) {
  EXPECT_TRUE(isVideoContentType("video/mp4"));
  EXPECT_TRUE(isVideoContentType("Video/QuickTime"));
  EXPECT_TRUE(isVideoContentType("video/webm; codecs=vp9"));
  EXPECT_FALSE(isVideoContentType("application/octet-stream"));
  EXPECT_FALSE(isVideoContentType("text/html"));
}

TEST(ResponseAssemblerTest, StripsControlCharactersFromFilename) {
  EXPECT_EQ(sanitizeFilename("v.mp4\r\nSet-Cookie: a=b"), "v.mp4Set-Cookie: a=b");

  auto response = assembleVideoResponse(MediaPayload{"x", "video/mp4", 1}, "\r\n");
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->at(http::field::content_disposition), "attachment; filename=video.mp4");
}

}
}
