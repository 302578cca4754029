#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "test_doubles.hpp"
#include "video_timeline/curl_wrapper.hpp"

namespace video_timeline {
namespace {

using test::kRefusedUrl;

TEST(CurlWrapperTest, ReadCallbackStreamsBodyInChunks) {
  std::istringstream body("abcdefgh");
  char buffer[3];

  EXPECT_EQ(CurlWrapper::ReadCallback(buffer, 1, sizeof(buffer), &body), 3u);
  EXPECT_EQ(std::string(buffer, 3), "abc");
  EXPECT_EQ(CurlWrapper::ReadCallback(buffer, 1, sizeof(buffer), &body), 3u);
  EXPECT_EQ(std::string(buffer, 3), "def");
  EXPECT_EQ(CurlWrapper::ReadCallback(buffer, 1, sizeof(buffer), &body), 2u);
  EXPECT_EQ(std::string(buffer, 2), "gh");
  EXPECT_EQ(CurlWrapper::ReadCallback(buffer, 1, sizeof(buffer), &body), 0u);
}

TEST(CurlWrapperTest, RefusedConnectionThrows) {
  CurlWrapper curl;
  curl.setUrl(std::string(kRefusedUrl) + "/v1/ping").setGet().setTimeoutSeconds(5);
  try {
    curl.perform();
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find("curl_easy_perform() failed"),
              std::string::npos);
  }
}

TEST(CurlWrapperTest, StreamedUploadToRefusedHostThrows) {
  std::istringstream body(std::string(4096, 'x'));
  CurlWrapper curl;
  curl.setUrl(std::string(kRefusedUrl) + "/v2/upload")
      .setUploadStream(body, 4096)
      .addHeader("Content-Type: application/octet-stream")
      .setTimeoutSeconds(5);
  EXPECT_THROW(curl.perform(), std::runtime_error);
}

} // namespace
} // namespace video_timeline
