#include "moly/ai/http.hpp"

#include <gtest/gtest.h>

using moly::ai::ErrorKind;

TEST(HttpTests, ClassifiesStatusCodes) {
  EXPECT_EQ(moly::ai::classify_status(401), ErrorKind::Unauthorized);
  EXPECT_EQ(moly::ai::classify_status(403), ErrorKind::Forbidden);
  EXPECT_EQ(moly::ai::classify_status(429), ErrorKind::RateLimited);
  EXPECT_EQ(moly::ai::classify_status(404), ErrorKind::Http);
  EXPECT_EQ(moly::ai::classify_status(503), ErrorKind::Http);
}

TEST(HttpTests, DescribesStatusCodes) {
  EXPECT_EQ(moly::ai::describe_status(401, "ignored"), "Invalid API key");
  EXPECT_EQ(moly::ai::describe_status(403, ""), "Access denied");
  EXPECT_EQ(moly::ai::describe_status(429, ""), "Rate limited");
  EXPECT_EQ(moly::ai::describe_status(418, "teapot"), "HTTP 418: teapot");

  auto error = moly::ai::status_error(429, "");
  EXPECT_EQ(error.kind, ErrorKind::RateLimited);
  EXPECT_EQ(error.status, 429);
  EXPECT_EQ(moly::ai::error_kind_name(ErrorKind::Cancelled), "cancelled");
}

TEST(HttpTests, JoinsUrlsWithSingleSlash) {
  EXPECT_EQ(moly::ai::join_url("https://a/v1/", "/models"), "https://a/v1/models");
  EXPECT_EQ(moly::ai::join_url("https://a/v1", "models"), "https://a/v1/models");
  EXPECT_EQ(moly::ai::join_url("https://a/v1//", ""), "https://a/v1");
}

TEST(HttpTests, EncodesQueryText) {
  EXPECT_EQ(moly::ai::url_encode("llama 3.1"), "llama%203.1");
  EXPECT_EQ(moly::ai::url_encode("a/b?c=d&e"), "a%2Fb%3Fc%3Dd%26e");
  EXPECT_EQ(moly::ai::url_encode("safe-_.~"), "safe-_.~");
  EXPECT_EQ(moly::ai::bearer_header("k"), "Authorization: Bearer k");
}
